#include "qv/ops/broadcast.hpp"
#include "../instantiate.hpp"

#include <functional>

namespace qv {
namespace {

template <class T, class Op>
Matrix<T> each_row_scalar(const Matrix<T>& m, T s, Op op) {
  Matrix<T> out;
  out.reserve(m.row_count());
  for (const auto& row : m) out.push_back(broadcast(row, s, op));
  return out;
}

} // namespace

template <class T>
Vector<T> broadcast_add(const Vector<T>& v, scalar_t<T> s) { return broadcast(v, s, std::plus<T>{}); }

template <class T>
Vector<T> broadcast_sub(const Vector<T>& v, scalar_t<T> s) { return broadcast(v, s, std::minus<T>{}); }

template <class T>
Vector<T> broadcast_mul(const Vector<T>& v, scalar_t<T> s) { return broadcast(v, s, std::multiplies<T>{}); }

template <class T>
Vector<T> broadcast_div(const Vector<T>& v, scalar_t<T> s) {
  if (s == T(0)) detail::throw_division_by_zero("broadcast_div");
  return broadcast(v, s, std::divides<T>{});
}

template <class T>
Vector<T> scalar_sub(scalar_t<T> s, const Vector<T>& v) {
  return broadcast(v, s, [](T x, T lhs) { return lhs - x; });
}

template <class T>
Vector<T> scalar_div(scalar_t<T> s, const Vector<T>& v) {
  detail::require_no_zero("scalar_div", v);
  return broadcast(v, s, [](T x, T lhs) { return lhs / x; });
}

template <class T>
Matrix<T> broadcast_add(const Matrix<T>& m, scalar_t<T> s) { return each_row_scalar(m, s, std::plus<T>{}); }

template <class T>
Matrix<T> broadcast_sub(const Matrix<T>& m, scalar_t<T> s) { return each_row_scalar(m, s, std::minus<T>{}); }

template <class T>
Matrix<T> broadcast_mul(const Matrix<T>& m, scalar_t<T> s) { return each_row_scalar(m, s, std::multiplies<T>{}); }

template <class T>
Matrix<T> broadcast_div(const Matrix<T>& m, scalar_t<T> s) {
  if (s == T(0)) detail::throw_division_by_zero("broadcast_div");
  return each_row_scalar(m, s, std::divides<T>{});
}

template <class T>
Matrix<T> add_to_each_row(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_rows(m, v, std::plus<T>{});
}

template <class T>
Matrix<T> subtract_from_each_row(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_rows(m, v, std::minus<T>{});
}

template <class T>
Matrix<T> multiply_each_row(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_rows(m, v, std::multiplies<T>{});
}

template <class T>
Matrix<T> divide_each_row(const Matrix<T>& m, const Vector<T>& v) {
  detail::require_uniform("divide_each_row", m);
  detail::require_length("divide_each_row", "column count", m.column_count(), v.size());
  detail::require_no_zero("divide_each_row", v);
  return broadcast_rows(m, v, std::divides<T>{});
}

template <class T>
Matrix<T> add_to_each_column(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_columns(m, v, std::plus<T>{});
}

template <class T>
Matrix<T> subtract_from_each_column(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_columns(m, v, std::minus<T>{});
}

template <class T>
Matrix<T> multiply_each_column(const Matrix<T>& m, const Vector<T>& v) {
  return broadcast_columns(m, v, std::multiplies<T>{});
}

template <class T>
Matrix<T> divide_each_column(const Matrix<T>& m, const Vector<T>& v) {
  detail::require_uniform("divide_each_column", m);
  detail::require_length("divide_each_column", "row count", m.row_count(), v.size());
  detail::require_no_zero("divide_each_column", v);
  return broadcast_columns(m, v, std::divides<T>{});
}

#define QV_INSTANTIATE_BROADCAST(T)                                                   \
  template Vector<T> broadcast_add<T>(const Vector<T>&, T);                           \
  template Vector<T> broadcast_sub<T>(const Vector<T>&, T);                           \
  template Vector<T> broadcast_mul<T>(const Vector<T>&, T);                           \
  template Vector<T> scalar_sub<T>(T, const Vector<T>&);                              \
  template Matrix<T> broadcast_add<T>(const Matrix<T>&, T);                           \
  template Matrix<T> broadcast_sub<T>(const Matrix<T>&, T);                           \
  template Matrix<T> broadcast_mul<T>(const Matrix<T>&, T);                           \
  template Matrix<T> add_to_each_row<T>(const Matrix<T>&, const Vector<T>&);          \
  template Matrix<T> subtract_from_each_row<T>(const Matrix<T>&, const Vector<T>&);   \
  template Matrix<T> multiply_each_row<T>(const Matrix<T>&, const Vector<T>&);        \
  template Matrix<T> add_to_each_column<T>(const Matrix<T>&, const Vector<T>&);       \
  template Matrix<T> subtract_from_each_column<T>(const Matrix<T>&, const Vector<T>&);\
  template Matrix<T> multiply_each_column<T>(const Matrix<T>&, const Vector<T>&);

#define QV_INSTANTIATE_BROADCAST_DIV(T)                                               \
  template Vector<T> broadcast_div<T>(const Vector<T>&, T);                           \
  template Vector<T> scalar_div<T>(T, const Vector<T>&);                              \
  template Matrix<T> broadcast_div<T>(const Matrix<T>&, T);                           \
  template Matrix<T> divide_each_row<T>(const Matrix<T>&, const Vector<T>&);          \
  template Matrix<T> divide_each_column<T>(const Matrix<T>&, const Vector<T>&);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_BROADCAST)
QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_BROADCAST_DIV)

} // namespace qv
