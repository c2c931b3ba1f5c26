#pragma once
#include <cstddef>
#include <vector>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv {

using Shape = std::vector<std::size_t>;

// {size}
template <class T>
inline Shape shape(const Vector<T>& v) { return Shape{v.size()}; }

// {rows, length of the first row}; tolerates ragged input.
template <class T>
inline Shape shape(const Matrix<T>& m) { return Shape{m.row_count(), m.column_count()}; }

template <class T>
inline bool is_ragged(const Matrix<T>& m) { return m.is_ragged(); }

} // namespace qv
