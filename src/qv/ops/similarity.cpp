#include "qv/ops/similarity.hpp"
#include "qv/core/checks.hpp"
#include "qv/core/log.hpp"
#include "qv/ops/vector_ops.hpp"
#include "qv/parallel/transform.hpp"
#include "../instantiate.hpp"

#include <algorithm>

namespace qv {

template <class T>
Vector<T> cosine_similarities(const Matrix<T>& database, const Vector<T>& query) {
  const std::size_t n = database.row_count();
  Vector<T> out(n);
  if (n == 0) return out;
  // validate up front so the reported row is deterministic
  for (std::size_t i = 0; i < n; ++i)
    detail::require_length("cosine_similarities", "row length", query.size(), database[i].size());
  if (magnitude(query) == T(0)) detail::throw_zero_vector("cosine_similarities", "query");

  QV_LOG_TRACE("cosine_similarities: {} rows of length {}", n, query.size());
  parallel::for_rows(n, [&](std::size_t i) { out[i] = cosine_of_angle(database[i], query); });
  return out;
}

template <class T>
std::vector<DuplicatePair<T>> find_duplicates(const Matrix<T>& database, scalar_t<T> threshold) {
  const std::size_t n = database.row_count();
  if (n < 2) return {};
  detail::require_uniform("find_duplicates", database);

  // per-row buckets keep (i, j) generation order independent of scheduling
  std::vector<std::vector<DuplicatePair<T>>> buckets(n);
  parallel::for_rows(n, [&](std::size_t i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const T sim = cosine_of_angle(database[i], database[j]);
      if (sim >= threshold) buckets[i].push_back({i, j, sim});
    }
  });

  std::vector<DuplicatePair<T>> pairs;
  for (auto& b : buckets) pairs.insert(pairs.end(), b.begin(), b.end());
  std::stable_sort(pairs.begin(), pairs.end(),
                   [](const DuplicatePair<T>& a, const DuplicatePair<T>& b) { return a.similarity > b.similarity; });
  QV_LOG_TRACE("find_duplicates: {} pair(s) >= {} among {} rows", pairs.size(), threshold, n);
  return pairs;
}

template <class T>
T cluster_cohesion(const Matrix<T>& items) {
  const std::size_t n = items.row_count();
  if (n < 2) return T(0);
  T total = T(0);
  std::size_t pairs = 0;
  for (std::size_t i = 0; i < n; ++i)
    for (std::size_t j = i + 1; j < n; ++j, ++pairs) total += cosine_of_angle(items[i], items[j]);
  return total / static_cast<T>(pairs);
}

template <class T>
bool are_valid_vector_dimensions(const Matrix<T>& vectors) {
  return !vectors.empty() && !vectors.is_ragged();
}

template <class T>
std::optional<Vector<T>> averaged(const Matrix<T>& vectors) {
  if (!are_valid_vector_dimensions(vectors)) return std::nullopt;
  Vector<T> acc(vectors.column_count(), T(0));
  for (const auto& row : vectors)
    for (std::size_t j = 0; j < row.size(); ++j) acc[j] += row[j];
  const T n = static_cast<T>(vectors.row_count());
  for (auto& x : acc) x /= n;
  return acc;
}

#define QV_INSTANTIATE_SIMILARITY(T)                                                       \
  template Vector<T> cosine_similarities<T>(const Matrix<T>&, const Vector<T>&);           \
  template std::vector<DuplicatePair<T>> find_duplicates<T>(const Matrix<T>&, T);          \
  template T cluster_cohesion<T>(const Matrix<T>&);                                        \
  template std::optional<Vector<T>> averaged<T>(const Matrix<T>&);                         \
  template bool are_valid_vector_dimensions<T>(const Matrix<T>&);

QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_SIMILARITY)

} // namespace qv
