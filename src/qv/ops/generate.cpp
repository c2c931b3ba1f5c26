#include "qv/ops/generate.hpp"
#include "qv/core/checks.hpp"
#include "../instantiate.hpp"

#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace qv {
namespace {

std::mt19937_64& thread_rng() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

} // namespace

template <class T> Vector<T> zeros(std::size_t n) { return Vector<T>(n, T(0)); }
template <class T> Vector<T> ones(std::size_t n) { return Vector<T>(n, T(1)); }
template <class T> Vector<T> full(std::size_t n, scalar_t<T> value) { return Vector<T>(n, value); }

template <class T> Matrix<T> zeros(std::size_t rows, std::size_t cols) { return Matrix<T>(rows, cols, T(0)); }
template <class T> Matrix<T> ones(std::size_t rows, std::size_t cols) { return Matrix<T>(rows, cols, T(1)); }
template <class T> Matrix<T> full(std::size_t rows, std::size_t cols, scalar_t<T> value) {
  return Matrix<T>(rows, cols, value);
}

template <class T>
Matrix<T> identity(std::size_t n) {
  detail::require_non_empty("identity", n, "dimension");
  Matrix<T> out(n, n, T(0));
  for (std::size_t i = 0; i < n; ++i) out[i][i] = T(1);
  return out;
}

template <class T>
Matrix<T> diag(const Vector<T>& diagonal) {
  detail::require_non_empty("diag", diagonal.size(), "diagonal");
  const std::size_t n = diagonal.size();
  Matrix<T> out(n, n, T(0));
  for (std::size_t i = 0; i < n; ++i) out[i][i] = diagonal[i];
  return out;
}

template <class T>
Vector<T> linspace(scalar_t<T> start, scalar_t<T> stop, std::size_t num) {
  detail::require_non_empty("linspace", num, "sample count");
  if (num == 1) return Vector<T>{start};
  const T step = (stop - start) / static_cast<T>(num - 1);
  Vector<T> out;
  out.reserve(num);
  for (std::size_t i = 0; i < num; ++i) out.push_back(start + step * static_cast<T>(i));
  return out;
}

template <class T>
Vector<T> arange(scalar_t<T> start, scalar_t<T> stop, scalar_t<T> step) {
  if (step == T(0)) throw std::invalid_argument("arange: step must be non-zero");
  Vector<T> out;
  if (step > T(0)) {
    for (T x = start; x < stop; x += step) out.push_back(x);
  } else {
    for (T x = start; x > stop; x += step) out.push_back(x);
  }
  return out;
}

template <class T>
Vector<T> random(std::size_t n) {
  std::uniform_real_distribution<T> dist(T(0), T(1));
  auto& gen = thread_rng();
  Vector<T> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(dist(gen));
  return out;
}

template <class T>
Matrix<T> random(std::size_t rows, std::size_t cols) {
  if (rows == 0 || cols == 0)
    throw EmptyInput(fmt::format("random: dimensions must be positive (got {}x{})", rows, cols));
  Matrix<T> out;
  out.reserve(rows);
  for (std::size_t i = 0; i < rows; ++i) out.push_back(random<T>(cols));
  return out;
}

#define QV_INSTANTIATE_GENERATE(T)                                       \
  template Vector<T> zeros<T>(std::size_t);                              \
  template Vector<T> ones<T>(std::size_t);                               \
  template Vector<T> full<T>(std::size_t, T);                            \
  template Matrix<T> zeros<T>(std::size_t, std::size_t);                 \
  template Matrix<T> ones<T>(std::size_t, std::size_t);                  \
  template Matrix<T> full<T>(std::size_t, std::size_t, T);               \
  template Matrix<T> identity<T>(std::size_t);                           \
  template Matrix<T> diag<T>(const Vector<T>&);                          \
  template Vector<T> arange<T>(T, T, T);

#define QV_INSTANTIATE_GENERATE_FLOATING(T)                              \
  template Vector<T> linspace<T>(T, T, std::size_t);                     \
  template Vector<T> random<T>(std::size_t);                             \
  template Matrix<T> random<T>(std::size_t, std::size_t);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_GENERATE)
QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_GENERATE_FLOATING)

} // namespace qv
