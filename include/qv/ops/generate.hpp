#pragma once
#include <cstddef>

#include "qv/core/matrix.hpp"
#include "qv/core/traits.hpp"
#include "qv/core/vector.hpp"

// Constructors for common vectors and matrices. The element type is always
// given explicitly: zeros<double>(3), identity<int>(4).

namespace qv {

template <class T> Vector<T> zeros(std::size_t n);
template <class T> Vector<T> ones(std::size_t n);
template <class T> Vector<T> full(std::size_t n, scalar_t<T> value);

template <class T> Matrix<T> zeros(std::size_t rows, std::size_t cols);
template <class T> Matrix<T> ones(std::size_t rows, std::size_t cols);
template <class T> Matrix<T> full(std::size_t rows, std::size_t cols, scalar_t<T> value);

// n x n identity; EmptyInput when n == 0.
template <class T> Matrix<T> identity(std::size_t n);

// Square matrix with `diagonal` on the diagonal; EmptyInput when empty.
template <class T> Matrix<T> diag(const Vector<T>& diagonal);

// `num` evenly spaced samples over [start, stop] (float/double). num == 0
// throws EmptyInput; num == 1 gives [start].
template <class T> Vector<T> linspace(scalar_t<T> start, scalar_t<T> stop, std::size_t num);

// start, start+step, ... while < stop (step > 0) or > stop (step < 0).
// step == 0 throws std::invalid_argument.
template <class T> Vector<T> arange(scalar_t<T> start, scalar_t<T> stop, scalar_t<T> step = T(1));

// Uniform [0, 1) samples (float/double) from a per-thread generator seeded
// by std::random_device. Not reproducible. random(r, c) requires r, c > 0.
template <class T> Vector<T> random(std::size_t n);
template <class T> Matrix<T> random(std::size_t rows, std::size_t cols);

} // namespace qv
