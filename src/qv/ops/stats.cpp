#include "qv/ops/stats.hpp"
#include "qv/ops/similarity.hpp"
#include "../instantiate.hpp"

#include <algorithm>
#include <cmath>

namespace qv {
namespace {

// index of the first element e with better(e, current best)
template <class T, class Better>
std::optional<std::size_t> extreme_index(const Vector<T>& v, Better better) {
  if (v.empty()) return std::nullopt;
  std::size_t best = 0;
  for (std::size_t i = 1; i < v.size(); ++i)
    if (better(v[i], v[best])) best = i;
  return best;
}

} // namespace

template <class T>
T sum(const Vector<T>& v) {
  T acc = T(0);
  for (const T& x : v) acc += x;
  return acc;
}

template <class T>
T product(const Vector<T>& v) {
  if (v.empty()) return T(0);
  T acc = v[0];
  for (std::size_t i = 1; i < v.size(); ++i) acc *= v[i];
  return acc;
}

template <class T>
std::optional<std::size_t> argmin(const Vector<T>& v) {
  return extreme_index(v, [](const T& a, const T& b) { return a < b; });
}

template <class T>
std::optional<std::size_t> argmax(const Vector<T>& v) {
  return extreme_index(v, [](const T& a, const T& b) { return a > b; });
}

template <class T>
std::optional<T> min(const Vector<T>& v) {
  const auto i = argmin(v);
  if (!i) return std::nullopt;
  return v[*i];
}

template <class T>
std::optional<T> max(const Vector<T>& v) {
  const auto i = argmax(v);
  if (!i) return std::nullopt;
  return v[*i];
}

template <class T>
Vector<T> cumulative_sum(const Vector<T>& v) {
  Vector<T> out;
  out.reserve(v.size());
  T acc = T(0);
  for (std::size_t i = 0; i < v.size(); ++i) {
    acc = i == 0 ? v[0] : acc + v[i];
    out.push_back(acc);
  }
  return out;
}

template <class T>
Vector<T> cumulative_product(const Vector<T>& v) {
  Vector<T> out;
  out.reserve(v.size());
  T acc = T(1);
  for (std::size_t i = 0; i < v.size(); ++i) {
    acc = i == 0 ? v[0] : acc * v[i];
    out.push_back(acc);
  }
  return out;
}

template <class T>
std::optional<T> mean(const Vector<T>& v) {
  if (v.empty()) return std::nullopt;
  return sum(v) / static_cast<T>(v.size());
}

template <class T>
std::optional<T> median(const Vector<T>& v) {
  if (v.empty()) return std::nullopt;
  std::vector<T> sorted = v.values();
  std::sort(sorted.begin(), sorted.end());
  const std::size_t n = sorted.size();
  if (n % 2 == 0) return (sorted[n / 2 - 1] + sorted[n / 2]) / T(2);
  return sorted[n / 2];
}

template <class T>
std::optional<T> variance(const Vector<T>& v, std::size_t ddof) {
  if (v.size() <= ddof) return std::nullopt;
  const T m = *mean(v);
  T acc = T(0);
  for (const T& x : v) acc += (x - m) * (x - m);
  return acc / static_cast<T>(v.size() - ddof);
}

template <class T>
std::optional<T> stddev(const Vector<T>& v, std::size_t ddof) {
  const auto var = variance(v, ddof);
  if (!var) return std::nullopt;
  return std::sqrt(*var);
}

template <class T>
Mask outlier_mask(const Vector<T>& data, scalar_t<T> threshold, std::optional<T> center,
                  std::optional<T> spread) {
  if (data.empty()) return {};
  const T m = center ? *center : *mean(data);
  const T s = spread ? *spread : *stddev(data);
  Mask out;
  out.reserve(data.size());
  for (const T& x : data) out.push_back(std::fabs(x - m) > threshold * s);
  return out;
}

template <class T>
std::optional<Vector<T>> mean_vector(const Matrix<T>& vectors) {
  return averaged(vectors);
}

#define QV_INSTANTIATE_STATS_EXACT(T)                                      \
  template T sum<T>(const Vector<T>&);                                     \
  template T product<T>(const Vector<T>&);                                 \
  template std::optional<T> min<T>(const Vector<T>&);                      \
  template std::optional<T> max<T>(const Vector<T>&);                      \
  template std::optional<std::size_t> argmin<T>(const Vector<T>&);         \
  template std::optional<std::size_t> argmax<T>(const Vector<T>&);         \
  template Vector<T> cumulative_sum<T>(const Vector<T>&);                  \
  template Vector<T> cumulative_product<T>(const Vector<T>&);

#define QV_INSTANTIATE_STATS_FLOATING(T)                                                      \
  template std::optional<T> mean<T>(const Vector<T>&);                                        \
  template std::optional<T> median<T>(const Vector<T>&);                                      \
  template std::optional<T> variance<T>(const Vector<T>&, std::size_t);                       \
  template std::optional<T> stddev<T>(const Vector<T>&, std::size_t);                         \
  template Mask outlier_mask<T>(const Vector<T>&, T, std::optional<T>, std::optional<T>);     \
  template std::optional<Vector<T>> mean_vector<T>(const Matrix<T>&);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_STATS_EXACT)
QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_STATS_FLOATING)

} // namespace qv
