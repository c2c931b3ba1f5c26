#pragma once
#include <cstddef>
#include <vector>

#include "qv/core/checks.hpp"
#include "qv/core/traits.hpp"
#include "qv/core/vector.hpp"

// Comparisons producing masks, mask algebra and mask-driven selection.
// Header-only: works for any T with the needed comparison operator.

namespace qv {

namespace detail {

template <class T, class Pred>
inline Mask compare_each(const Vector<T>& v, Pred pred) {
  Mask out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(pred(x));
  return out;
}

template <class T, class Pred>
inline Mask compare_pairwise(const char* op, const Vector<T>& a, const Vector<T>& b, Pred pred) {
  require_same_length(op, a.size(), b.size());
  Mask out;
  out.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out.push_back(pred(a[i], b[i]));
  return out;
}

} // namespace detail

// ---- against a scalar ----
template <class T> inline Mask is_equal(const Vector<T>& v, scalar_t<T> s) {
  return detail::compare_each(v, [&](const T& x) { return x == s; });
}
template <class T> inline Mask is_greater_than(const Vector<T>& v, scalar_t<T> s) {
  return detail::compare_each(v, [&](const T& x) { return x > s; });
}
template <class T> inline Mask is_less_than(const Vector<T>& v, scalar_t<T> s) {
  return detail::compare_each(v, [&](const T& x) { return x < s; });
}
template <class T> inline Mask is_greater_than_or_equal(const Vector<T>& v, scalar_t<T> s) {
  return detail::compare_each(v, [&](const T& x) { return x >= s; });
}
template <class T> inline Mask is_less_than_or_equal(const Vector<T>& v, scalar_t<T> s) {
  return detail::compare_each(v, [&](const T& x) { return x <= s; });
}

// ---- element-wise; DimensionMismatch on unequal lengths ----
template <class T> inline Mask is_equal(const Vector<T>& a, const Vector<T>& b) {
  return detail::compare_pairwise("is_equal", a, b, [](const T& x, const T& y) { return x == y; });
}
template <class T> inline Mask is_greater_than(const Vector<T>& a, const Vector<T>& b) {
  return detail::compare_pairwise("is_greater_than", a, b, [](const T& x, const T& y) { return x > y; });
}
template <class T> inline Mask is_less_than(const Vector<T>& a, const Vector<T>& b) {
  return detail::compare_pairwise("is_less_than", a, b, [](const T& x, const T& y) { return x < y; });
}
template <class T> inline Mask is_greater_than_or_equal(const Vector<T>& a, const Vector<T>& b) {
  return detail::compare_pairwise("is_greater_than_or_equal", a, b,
                                  [](const T& x, const T& y) { return x >= y; });
}
template <class T> inline Mask is_less_than_or_equal(const Vector<T>& a, const Vector<T>& b) {
  return detail::compare_pairwise("is_less_than_or_equal", a, b,
                                  [](const T& x, const T& y) { return x <= y; });
}

// ---- mask algebra ----
inline Mask logical_and(const Mask& a, const Mask& b) {
  detail::require_same_length("logical_and", a.size(), b.size());
  Mask out(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out[i] = a[i] && b[i];
  return out;
}

inline Mask logical_or(const Mask& a, const Mask& b) {
  detail::require_same_length("logical_or", a.size(), b.size());
  Mask out(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out[i] = a[i] || b[i];
  return out;
}

inline Mask logical_not(const Mask& m) {
  Mask out(m.size());
  for (std::size_t i = 0; i < m.size(); ++i) out[i] = !m[i];
  return out;
}

inline std::vector<std::size_t> true_indices(const Mask& m) {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < m.size(); ++i)
    if (m[i]) out.push_back(i);
  return out;
}

// ---- selection ----

// Elements whose mask bit is set, in source order.
template <class T>
inline Vector<T> masked(const Vector<T>& source, const Mask& mask) {
  detail::require_same_length("masked", source.size(), mask.size());
  Vector<T> out;
  for (std::size_t i = 0; i < source.size(); ++i)
    if (mask[i]) out.push_back(source[i]);
  return out;
}

// condition[i] ? source[i] : other[i]
template <class T>
inline Vector<T> choose(const Vector<T>& source, const Mask& condition, const Vector<T>& other) {
  detail::require_same_length("choose", source.size(), condition.size());
  detail::require_same_length("choose", source.size(), other.size());
  Vector<T> out;
  out.reserve(source.size());
  for (std::size_t i = 0; i < source.size(); ++i) out.push_back(condition[i] ? source[i] : other[i]);
  return out;
}

} // namespace qv
