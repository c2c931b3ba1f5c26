#pragma once
#include <cstddef>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// r x c -> c x r. An empty matrix (or one whose first row is empty) gives an
// empty matrix; ragged input throws DimensionMismatch. transpose(transpose(m))
// == m for every r x c with c > 0; an r x 0 matrix comes back with no rows.
template <class T> Matrix<T> transpose(const Matrix<T>& m);

// Matrix product (not Hadamard). a.cols must equal b.rows; result is
// a.rows x b.cols. Empty operands throw EmptyInput. Output rows are computed
// on the parallel pool.
template <class T> Matrix<T> multiply_matrix(const Matrix<T>& a, const Matrix<T>& b);

// result[i] = dot(m[i], v); m.cols must equal v.size().
template <class T> Vector<T> transform(const Matrix<T>& m, const Vector<T>& v);
template <class T> Vector<T> transformed_by(const Vector<T>& v, const Matrix<T>& m);

// Copies of a single column / row; std::out_of_range past the end.
template <class T> Vector<T> column(const Matrix<T>& m, std::size_t j);
template <class T> Vector<T> row(const Matrix<T>& m, std::size_t i);

} // namespace qv
