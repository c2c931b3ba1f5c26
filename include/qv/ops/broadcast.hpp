#pragma once
#include <cstddef>
#include <utility>

#include "qv/core/checks.hpp"
#include "qv/core/matrix.hpp"
#include "qv/core/traits.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// ---- scalar on the right: v[i] op s ----
template <class T> Vector<T> broadcast_add(const Vector<T>& v, scalar_t<T> s);
template <class T> Vector<T> broadcast_sub(const Vector<T>& v, scalar_t<T> s);
template <class T> Vector<T> broadcast_mul(const Vector<T>& v, scalar_t<T> s);
// float/double; DivisionByZero when s == 0
template <class T> Vector<T> broadcast_div(const Vector<T>& v, scalar_t<T> s);

// ---- scalar on the left: s op v[i] ----
template <class T> Vector<T> scalar_sub(scalar_t<T> s, const Vector<T>& v);
// float/double; DivisionByZero when any v[i] == 0
template <class T> Vector<T> scalar_div(scalar_t<T> s, const Vector<T>& v);

// ---- matrix and scalar, row by row ----
template <class T> Matrix<T> broadcast_add(const Matrix<T>& m, scalar_t<T> s);
template <class T> Matrix<T> broadcast_sub(const Matrix<T>& m, scalar_t<T> s);
template <class T> Matrix<T> broadcast_mul(const Matrix<T>& m, scalar_t<T> s);
template <class T> Matrix<T> broadcast_div(const Matrix<T>& m, scalar_t<T> s);

// ---- row broadcast: v.size() must equal the column count ----
template <class T> Matrix<T> add_to_each_row(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> subtract_from_each_row(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> multiply_each_row(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> divide_each_row(const Matrix<T>& m, const Vector<T>& v);

// ---- column broadcast: v.size() must equal the row count; v[i] hits row i ----
template <class T> Matrix<T> add_to_each_column(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> subtract_from_each_column(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> multiply_each_column(const Matrix<T>& m, const Vector<T>& v);
template <class T> Matrix<T> divide_each_column(const Matrix<T>& m, const Vector<T>& v);

// ---- operators ----
template <class T> inline Vector<T> operator+(const Vector<T>& v, scalar_t<T> s) { return broadcast_add(v, s); }
template <class T> inline Vector<T> operator-(const Vector<T>& v, scalar_t<T> s) { return broadcast_sub(v, s); }
template <class T> inline Vector<T> operator*(const Vector<T>& v, scalar_t<T> s) { return broadcast_mul(v, s); }
template <class T> inline Vector<T> operator/(const Vector<T>& v, scalar_t<T> s) { return broadcast_div(v, s); }

template <class T> inline Vector<T> operator+(scalar_t<T> s, const Vector<T>& v) { return broadcast_add(v, s); }
template <class T> inline Vector<T> operator*(scalar_t<T> s, const Vector<T>& v) { return broadcast_mul(v, s); }
template <class T> inline Vector<T> operator-(scalar_t<T> s, const Vector<T>& v) { return scalar_sub(s, v); }
template <class T> inline Vector<T> operator/(scalar_t<T> s, const Vector<T>& v) { return scalar_div(s, v); }

template <class T> inline Matrix<T> operator+(const Matrix<T>& m, scalar_t<T> s) { return broadcast_add(m, s); }
template <class T> inline Matrix<T> operator-(const Matrix<T>& m, scalar_t<T> s) { return broadcast_sub(m, s); }
template <class T> inline Matrix<T> operator*(const Matrix<T>& m, scalar_t<T> s) { return broadcast_mul(m, s); }
template <class T> inline Matrix<T> operator/(const Matrix<T>& m, scalar_t<T> s) { return broadcast_div(m, s); }
template <class T> inline Matrix<T> operator*(scalar_t<T> s, const Matrix<T>& m) { return broadcast_mul(m, s); }

// ---- generic forms with a caller-supplied op(element, operand) ----

template <class T, class Op>
inline Vector<T> broadcast(const Vector<T>& v, scalar_t<T> s, Op&& op) {
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(op(x, s));
  return out;
}

template <class T, class Op>
inline Matrix<T> broadcast_rows(const Matrix<T>& m, const Vector<T>& v, Op&& op) {
  detail::require_uniform("broadcast_rows", m);
  detail::require_length("broadcast_rows", "column count", m.column_count(), v.size());
  Matrix<T> out;
  out.reserve(m.row_count());
  for (const auto& row : m) {
    Vector<T> r;
    r.reserve(row.size());
    for (std::size_t j = 0; j < row.size(); ++j) r.push_back(op(row[j], v[j]));
    out.push_back(std::move(r));
  }
  return out;
}

template <class T, class Op>
inline Matrix<T> broadcast_columns(const Matrix<T>& m, const Vector<T>& v, Op&& op) {
  detail::require_uniform("broadcast_columns", m);
  detail::require_length("broadcast_columns", "row count", m.row_count(), v.size());
  Matrix<T> out;
  out.reserve(m.row_count());
  for (std::size_t i = 0; i < m.row_count(); ++i) out.push_back(broadcast(m[i], v[i], op));
  return out;
}

} // namespace qv
