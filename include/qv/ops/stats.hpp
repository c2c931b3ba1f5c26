#pragma once
#include <cstddef>
#include <optional>

#include "qv/core/matrix.hpp"
#include "qv/core/traits.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// Any numeric T.
template <class T> T sum(const Vector<T>& v);
// Product of the elements; 0 (not 1) for an empty vector.
template <class T> T product(const Vector<T>& v);

// Left-to-right scan with strict comparison: the first extreme wins.
template <class T> std::optional<T> min(const Vector<T>& v);
template <class T> std::optional<T> max(const Vector<T>& v);
template <class T> std::optional<std::size_t> argmin(const Vector<T>& v);
template <class T> std::optional<std::size_t> argmax(const Vector<T>& v);

template <class T> Vector<T> cumulative_sum(const Vector<T>& v);
template <class T> Vector<T> cumulative_product(const Vector<T>& v);

// float/double from here on.
template <class T> std::optional<T> mean(const Vector<T>& v);
template <class T> std::optional<T> median(const Vector<T>& v);

// Σ(x - mean)² / (n - ddof); nullopt when n <= ddof.
template <class T> std::optional<T> variance(const Vector<T>& v, std::size_t ddof = 0);
template <class T> std::optional<T> stddev(const Vector<T>& v, std::size_t ddof = 0);

// |x - center| > threshold * spread per element. center/spread default to
// the population mean and standard deviation of `data`.
template <class T>
Mask outlier_mask(const Vector<T>& data, scalar_t<T> threshold = T(2),
                  std::optional<T> center = std::nullopt, std::optional<T> spread = std::nullopt);

// Column-wise mean of equal-length rows; nullopt when empty or ragged.
template <class T> std::optional<Vector<T>> mean_vector(const Matrix<T>& vectors);

} // namespace qv
