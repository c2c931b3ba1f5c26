#pragma once
#include "qv/core/vector.hpp"

namespace qv {

// Element-wise math maps (float/double). IEEE semantics for out-of-domain
// inputs: log(-1) is NaN, log(0) is -inf; nothing throws.
template <class T> Vector<T> power(const Vector<T>& v, T exponent);
template <class T> Vector<T> square(const Vector<T>& v);
template <class T> Vector<T> sqrt(const Vector<T>& v);
template <class T> Vector<T> exp(const Vector<T>& v);
template <class T> Vector<T> log(const Vector<T>& v);
template <class T> Vector<T> log10(const Vector<T>& v);
template <class T> Vector<T> sin(const Vector<T>& v);
template <class T> Vector<T> cos(const Vector<T>& v);
template <class T> Vector<T> tan(const Vector<T>& v);
template <class T> Vector<T> floor(const Vector<T>& v);
template <class T> Vector<T> ceil(const Vector<T>& v);
template <class T> Vector<T> round(const Vector<T>& v);
template <class T> Vector<T> abs(const Vector<T>& v);

} // namespace qv
