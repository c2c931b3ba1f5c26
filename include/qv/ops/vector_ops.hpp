#pragma once
#include "qv/core/vector.hpp"

namespace qv {

// Σ a[i]*b[i]; DimensionMismatch on unequal lengths. Any numeric T.
template <class T> T dot(const Vector<T>& a, const Vector<T>& b);

// The rest are float/double only.

// Euclidean norm; 0 for the zero vector (and for []).
template <class T> T magnitude(const Vector<T>& v);

// v / |v|; ZeroVector when |v| == 0.
template <class T> Vector<T> normalized(const Vector<T>& v);

// dot(a,b) / (|a||b|), unclamped; ZeroVector if either side has |x| == 0.
template <class T> T cosine_of_angle(const Vector<T>& a, const Vector<T>& b);

// acos(cosine_of_angle) in radians. No clamping: rounding that pushes the
// cosine just past ±1 yields NaN.
template <class T> T angle(const Vector<T>& a, const Vector<T>& b);
template <class T> T angle_in_degrees(const Vector<T>& a, const Vector<T>& b);

// |a - b|
template <class T> T distance(const Vector<T>& a, const Vector<T>& b);

// Length of a along b: dot(a,b)/|b|; ZeroVector when |b| == 0.
template <class T> T scalar_projection(const Vector<T>& a, const Vector<T>& b);

// (dot(a,b)/dot(b,b)) * b; ZeroVector when dot(b,b) == 0.
template <class T> Vector<T> vector_projection(const Vector<T>& a, const Vector<T>& b);

// a - vector_projection(a, b); orthogonal to b up to rounding.
template <class T> Vector<T> orthogonal_component(const Vector<T>& a, const Vector<T>& b);

} // namespace qv
