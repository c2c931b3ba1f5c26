#pragma once
#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// Element-wise arithmetic on equal-length vectors / equal-shape matrices.
// Length or shape mismatch throws DimensionMismatch; div throws
// DivisionByZero on any zero divisor. div is float/double only.
template <class T> Vector<T> add(const Vector<T>& a, const Vector<T>& b);
template <class T> Vector<T> sub(const Vector<T>& a, const Vector<T>& b);
template <class T> Vector<T> mul(const Vector<T>& a, const Vector<T>& b);
template <class T> Vector<T> div(const Vector<T>& a, const Vector<T>& b);

// Row-wise application of the vector forms; ragged operands are rejected.
template <class T> Matrix<T> add(const Matrix<T>& a, const Matrix<T>& b);
template <class T> Matrix<T> sub(const Matrix<T>& a, const Matrix<T>& b);
template <class T> Matrix<T> mul(const Matrix<T>& a, const Matrix<T>& b);
template <class T> Matrix<T> div(const Matrix<T>& a, const Matrix<T>& b);

template <class T> Vector<T> negated(const Vector<T>& v);

template <class T> inline Vector<T> operator+(const Vector<T>& a, const Vector<T>& b) { return add(a, b); }
template <class T> inline Vector<T> operator-(const Vector<T>& a, const Vector<T>& b) { return sub(a, b); }
template <class T> inline Vector<T> operator*(const Vector<T>& a, const Vector<T>& b) { return mul(a, b); }
template <class T> inline Vector<T> operator/(const Vector<T>& a, const Vector<T>& b) { return div(a, b); }
template <class T> inline Vector<T> operator-(const Vector<T>& v) { return negated(v); }

// `*` on matrices is the Hadamard product; see multiply_matrix for matmul.
template <class T> inline Matrix<T> operator+(const Matrix<T>& a, const Matrix<T>& b) { return add(a, b); }
template <class T> inline Matrix<T> operator-(const Matrix<T>& a, const Matrix<T>& b) { return sub(a, b); }
template <class T> inline Matrix<T> operator*(const Matrix<T>& a, const Matrix<T>& b) { return mul(a, b); }
template <class T> inline Matrix<T> operator/(const Matrix<T>& a, const Matrix<T>& b) { return div(a, b); }

} // namespace qv
