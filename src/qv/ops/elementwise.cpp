#include "qv/ops/elementwise.hpp"
#include "qv/core/checks.hpp"
#include "../instantiate.hpp"

#include <cstddef>
#include <functional>

namespace qv {
namespace {

template <class T, class Op>
Vector<T> zip(const char* op, const Vector<T>& a, const Vector<T>& b, Op f) {
  detail::require_same_length(op, a.size(), b.size());
  Vector<T> out;
  out.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out.push_back(f(a[i], b[i]));
  return out;
}

template <class T, class Op>
Matrix<T> zip_rows(const char* op, const Matrix<T>& a, const Matrix<T>& b, Op f) {
  detail::require_same_shape(op, a, b);
  Matrix<T> out;
  out.reserve(a.row_count());
  for (std::size_t i = 0; i < a.row_count(); ++i) out.push_back(zip(op, a[i], b[i], f));
  return out;
}

} // namespace

template <class T>
Vector<T> add(const Vector<T>& a, const Vector<T>& b) { return zip("add", a, b, std::plus<T>{}); }

template <class T>
Vector<T> sub(const Vector<T>& a, const Vector<T>& b) { return zip("sub", a, b, std::minus<T>{}); }

template <class T>
Vector<T> mul(const Vector<T>& a, const Vector<T>& b) { return zip("mul", a, b, std::multiplies<T>{}); }

template <class T>
Vector<T> div(const Vector<T>& a, const Vector<T>& b) {
  detail::require_same_length("div", a.size(), b.size());
  detail::require_no_zero("div", b);
  return zip("div", a, b, std::divides<T>{});
}

template <class T>
Matrix<T> add(const Matrix<T>& a, const Matrix<T>& b) { return zip_rows("add", a, b, std::plus<T>{}); }

template <class T>
Matrix<T> sub(const Matrix<T>& a, const Matrix<T>& b) { return zip_rows("sub", a, b, std::minus<T>{}); }

template <class T>
Matrix<T> mul(const Matrix<T>& a, const Matrix<T>& b) { return zip_rows("mul", a, b, std::multiplies<T>{}); }

template <class T>
Matrix<T> div(const Matrix<T>& a, const Matrix<T>& b) {
  detail::require_same_shape("div", a, b);
  for (const auto& row : b) detail::require_no_zero("div", row);
  return zip_rows("div", a, b, std::divides<T>{});
}

template <class T>
Vector<T> negated(const Vector<T>& v) {
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(-x);
  return out;
}

#define QV_INSTANTIATE_EXACT(T)                                           \
  template Vector<T> add<T>(const Vector<T>&, const Vector<T>&);          \
  template Vector<T> sub<T>(const Vector<T>&, const Vector<T>&);          \
  template Vector<T> mul<T>(const Vector<T>&, const Vector<T>&);          \
  template Matrix<T> add<T>(const Matrix<T>&, const Matrix<T>&);          \
  template Matrix<T> sub<T>(const Matrix<T>&, const Matrix<T>&);          \
  template Matrix<T> mul<T>(const Matrix<T>&, const Matrix<T>&);          \
  template Vector<T> negated<T>(const Vector<T>&);

#define QV_INSTANTIATE_DIV(T)                                             \
  template Vector<T> div<T>(const Vector<T>&, const Vector<T>&);          \
  template Matrix<T> div<T>(const Matrix<T>&, const Matrix<T>&);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_EXACT)
QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_DIV)

} // namespace qv
