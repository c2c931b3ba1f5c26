// Matrix algebra over row-of-rows matrices.
//
//   transpose        r x c -> c x r
//   multiply_matrix  C = A @ B, A:(M,K) B:(K,N) -> C:(M,N)
//   transform        y = M v
//
// multiply_matrix hands each output row to one pool task and accumulates
// over k in ascending order inside that row, so the result does not depend
// on the thread count.

#include "qv/ops/linalg.hpp"
#include "qv/core/checks.hpp"
#include "qv/core/log.hpp"
#include "qv/ops/vector_ops.hpp"
#include "qv/parallel/transform.hpp"
#include "../instantiate.hpp"

namespace qv {

template <class T>
Matrix<T> transpose(const Matrix<T>& m) {
  detail::require_uniform("transpose", m);
  const std::size_t rows = m.row_count();
  const std::size_t cols = m.column_count();
  if (rows == 0 || cols == 0) return Matrix<T>{};
  Matrix<T> out(cols, rows);
  for (std::size_t i = 0; i < rows; ++i)
    for (std::size_t j = 0; j < cols; ++j) out[j][i] = m[i][j];
  return out;
}

template <class T>
Matrix<T> multiply_matrix(const Matrix<T>& a, const Matrix<T>& b) {
  detail::require_uniform("multiply_matrix", a);
  detail::require_uniform("multiply_matrix", b);
  detail::require_non_empty("multiply_matrix", a.row_count() * a.column_count(), "left operand");
  detail::require_non_empty("multiply_matrix", b.row_count() * b.column_count(), "right operand");
  detail::require_length("multiply_matrix", "inner dimension", a.column_count(), b.row_count());

  const std::size_t M = a.row_count(), K = a.column_count(), N = b.column_count();
  QV_LOG_TRACE("multiply_matrix: ({}x{}) @ ({}x{})", M, K, K, N);

  Matrix<T> c(M, N, T(0));
  parallel::for_rows(M, [&](std::size_t i) {
    auto& crow = c[i];
    const auto& arow = a[i];
    for (std::size_t k = 0; k < K; ++k) {
      const T aik = arow[k];
      const auto& brow = b[k];
      for (std::size_t j = 0; j < N; ++j) crow[j] += aik * brow[j];
    }
  });
  return c;
}

template <class T>
Vector<T> transform(const Matrix<T>& m, const Vector<T>& v) {
  detail::require_uniform("transform", m);
  if (m.empty()) detail::throw_dimension_mismatch("transform", "matrix has no columns");
  detail::require_length("transform", "column count", m.column_count(), v.size());
  Vector<T> out;
  out.reserve(m.row_count());
  for (const auto& r : m) out.push_back(dot(r, v));
  return out;
}

template <class T>
Vector<T> transformed_by(const Vector<T>& v, const Matrix<T>& m) {
  return transform(m, v);
}

template <class T>
Vector<T> column(const Matrix<T>& m, std::size_t j) {
  detail::require_uniform("column", m);
  detail::require_index("column", j, m.column_count(), "column");
  Vector<T> out;
  out.reserve(m.row_count());
  for (const auto& r : m) out.push_back(r[j]);
  return out;
}

template <class T>
Vector<T> row(const Matrix<T>& m, std::size_t i) {
  detail::require_index("row", i, m.row_count(), "row");
  return m[i];
}

#define QV_INSTANTIATE_LINALG(T)                                              \
  template Matrix<T> transpose<T>(const Matrix<T>&);                          \
  template Matrix<T> multiply_matrix<T>(const Matrix<T>&, const Matrix<T>&);  \
  template Vector<T> transform<T>(const Matrix<T>&, const Vector<T>&);        \
  template Vector<T> transformed_by<T>(const Vector<T>&, const Matrix<T>&);   \
  template Vector<T> column<T>(const Matrix<T>&, std::size_t);                \
  template Vector<T> row<T>(const Matrix<T>&, std::size_t);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_LINALG)

} // namespace qv
