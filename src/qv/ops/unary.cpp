#include "qv/ops/unary.hpp"
#include "../instantiate.hpp"

#include <cmath>

namespace qv {
namespace {

template <class T, class Fn>
Vector<T> map(const Vector<T>& v, Fn f) {
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(static_cast<T>(f(x)));
  return out;
}

} // namespace

template <class T>
Vector<T> power(const Vector<T>& v, T exponent) {
  return map(v, [exponent](T x) { return std::pow(x, exponent); });
}

template <class T> Vector<T> square(const Vector<T>& v) { return map(v, [](T x) { return x * x; }); }
template <class T> Vector<T> sqrt(const Vector<T>& v) { return map(v, [](T x) { return std::sqrt(x); }); }
template <class T> Vector<T> exp(const Vector<T>& v) { return map(v, [](T x) { return std::exp(x); }); }
template <class T> Vector<T> log(const Vector<T>& v) { return map(v, [](T x) { return std::log(x); }); }
template <class T> Vector<T> log10(const Vector<T>& v) { return map(v, [](T x) { return std::log10(x); }); }
template <class T> Vector<T> sin(const Vector<T>& v) { return map(v, [](T x) { return std::sin(x); }); }
template <class T> Vector<T> cos(const Vector<T>& v) { return map(v, [](T x) { return std::cos(x); }); }
template <class T> Vector<T> tan(const Vector<T>& v) { return map(v, [](T x) { return std::tan(x); }); }
template <class T> Vector<T> floor(const Vector<T>& v) { return map(v, [](T x) { return std::floor(x); }); }
template <class T> Vector<T> ceil(const Vector<T>& v) { return map(v, [](T x) { return std::ceil(x); }); }
template <class T> Vector<T> round(const Vector<T>& v) { return map(v, [](T x) { return std::round(x); }); }
template <class T> Vector<T> abs(const Vector<T>& v) { return map(v, [](T x) { return std::fabs(x); }); }

#define QV_INSTANTIATE_UNARY(T)                          \
  template Vector<T> power<T>(const Vector<T>&, T);      \
  template Vector<T> square<T>(const Vector<T>&);        \
  template Vector<T> sqrt<T>(const Vector<T>&);          \
  template Vector<T> exp<T>(const Vector<T>&);           \
  template Vector<T> log<T>(const Vector<T>&);           \
  template Vector<T> log10<T>(const Vector<T>&);         \
  template Vector<T> sin<T>(const Vector<T>&);           \
  template Vector<T> cos<T>(const Vector<T>&);           \
  template Vector<T> tan<T>(const Vector<T>&);           \
  template Vector<T> floor<T>(const Vector<T>&);         \
  template Vector<T> ceil<T>(const Vector<T>&);          \
  template Vector<T> round<T>(const Vector<T>&);         \
  template Vector<T> abs<T>(const Vector<T>&);

QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_UNARY)

} // namespace qv
