#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "qv/core/matrix.hpp"
#include "qv/core/traits.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// Batch similarity over the rows of a matrix (float/double). Rows are
// evaluated on the parallel pool; each row writes only its own result, so
// output is identical to a serial loop.

// cosine_of_angle(database[i], query) for every row, in row order.
template <class T>
Vector<T> cosine_similarities(const Matrix<T>& database, const Vector<T>& query);

template <class T>
struct DuplicatePair {
  std::size_t first;   // lower row index
  std::size_t second;  // higher row index
  T similarity;
};

// Every pair i < j with cosine >= threshold, most similar first. Equal
// similarities stay in (i, j) order.
template <class T>
std::vector<DuplicatePair<T>> find_duplicates(const Matrix<T>& database, scalar_t<T> threshold = T(0.95));

// Mean pairwise cosine over unordered pairs; 0 for fewer than two items.
template <class T>
T cluster_cohesion(const Matrix<T>& items);

// Element-wise mean of the rows; nullopt when empty or ragged.
template <class T>
std::optional<Vector<T>> averaged(const Matrix<T>& vectors);

// Non-empty and every row as long as the first.
template <class T>
bool are_valid_vector_dimensions(const Matrix<T>& vectors);

} // namespace qv
