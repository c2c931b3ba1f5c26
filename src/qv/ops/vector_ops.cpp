#include "qv/ops/vector_ops.hpp"
#include "qv/core/checks.hpp"
#include "qv/ops/broadcast.hpp"
#include "qv/ops/elementwise.hpp"
#include "../instantiate.hpp"

#include <cmath>
#include <cstddef>

namespace qv {
namespace {
constexpr double kPi = 3.14159265358979323846;
} // namespace

template <class T>
T dot(const Vector<T>& a, const Vector<T>& b) {
  detail::require_same_length("dot", a.size(), b.size());
  T acc = T(0);
  for (std::size_t i = 0; i < a.size(); ++i) acc += a[i] * b[i];
  return acc;
}

template <class T>
T magnitude(const Vector<T>& v) {
  T acc = T(0);
  for (const T& x : v) acc += x * x;
  return std::sqrt(acc);
}

template <class T>
Vector<T> normalized(const Vector<T>& v) {
  const T len = magnitude(v);
  if (len == T(0)) detail::throw_zero_vector("normalized", "vector");
  return broadcast_div(v, len);
}

template <class T>
T cosine_of_angle(const Vector<T>& a, const Vector<T>& b) {
  const T d = dot(a, b);
  const T la = magnitude(a);
  const T lb = magnitude(b);
  if (la == T(0)) detail::throw_zero_vector("cosine_of_angle", "first vector");
  if (lb == T(0)) detail::throw_zero_vector("cosine_of_angle", "second vector");
  return d / (la * lb);
}

template <class T>
T angle(const Vector<T>& a, const Vector<T>& b) {
  return std::acos(cosine_of_angle(a, b));
}

template <class T>
T angle_in_degrees(const Vector<T>& a, const Vector<T>& b) {
  return angle(a, b) * T(180) / T(kPi);
}

template <class T>
T distance(const Vector<T>& a, const Vector<T>& b) {
  return magnitude(sub(a, b));
}

template <class T>
T scalar_projection(const Vector<T>& a, const Vector<T>& b) {
  const T d = dot(a, b);
  const T lb = magnitude(b);
  if (lb == T(0)) detail::throw_zero_vector("scalar_projection", "projection target");
  return d / lb;
}

template <class T>
Vector<T> vector_projection(const Vector<T>& a, const Vector<T>& b) {
  const T ab = dot(a, b);
  const T bb = dot(b, b);
  if (bb == T(0)) detail::throw_zero_vector("vector_projection", "projection target");
  return broadcast_mul(b, ab / bb);
}

template <class T>
Vector<T> orthogonal_component(const Vector<T>& a, const Vector<T>& b) {
  return sub(a, vector_projection(a, b));
}

#define QV_INSTANTIATE_DOT(T) template T dot<T>(const Vector<T>&, const Vector<T>&);

#define QV_INSTANTIATE_GEOMETRY(T)                                                 \
  template T magnitude<T>(const Vector<T>&);                                       \
  template Vector<T> normalized<T>(const Vector<T>&);                              \
  template T cosine_of_angle<T>(const Vector<T>&, const Vector<T>&);               \
  template T angle<T>(const Vector<T>&, const Vector<T>&);                         \
  template T angle_in_degrees<T>(const Vector<T>&, const Vector<T>&);              \
  template T distance<T>(const Vector<T>&, const Vector<T>&);                      \
  template T scalar_projection<T>(const Vector<T>&, const Vector<T>&);             \
  template Vector<T> vector_projection<T>(const Vector<T>&, const Vector<T>&);     \
  template Vector<T> orthogonal_component<T>(const Vector<T>&, const Vector<T>&);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_DOT)
QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_GEOMETRY)

} // namespace qv
