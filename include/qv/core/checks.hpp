#pragma once
#include <cstddef>

#include "qv/core/errors.hpp"
#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv::detail {

// Precondition helpers. Each throws the matching qv error with a message
// naming the op and the offending sizes; nothing is written before they run.
void require_same_length(const char* op, std::size_t lhs, std::size_t rhs);
void require_length(const char* op, const char* what, std::size_t expected, std::size_t got);
void require_non_empty(const char* op, std::size_t n, const char* what);
void require_index(const char* op, std::size_t index, std::size_t bound, const char* what);

[[noreturn]] void throw_dimension_mismatch(const char* op, const char* reason);
[[noreturn]] void throw_division_by_zero(const char* op, std::size_t index);
[[noreturn]] void throw_division_by_zero(const char* op);
[[noreturn]] void throw_zero_vector(const char* op, const char* which);
[[noreturn]] void throw_ragged(const char* op, std::size_t row, std::size_t expected, std::size_t got);

template <class T>
inline void require_uniform(const char* op, const Matrix<T>& m) {
  const std::size_t cols = m.column_count();
  for (std::size_t i = 0; i < m.row_count(); ++i)
    if (m[i].size() != cols) throw_ragged(op, i, cols, m[i].size());
}

template <class T>
inline void require_same_shape(const char* op, const Matrix<T>& a, const Matrix<T>& b) {
  require_uniform(op, a);
  require_uniform(op, b);
  require_length(op, "row count", a.row_count(), b.row_count());
  if (a.row_count() > 0) require_length(op, "column count", a.column_count(), b.column_count());
}

template <class T>
inline void require_no_zero(const char* op, const Vector<T>& divisor) {
  for (std::size_t i = 0; i < divisor.size(); ++i)
    if (divisor[i] == T(0)) throw_division_by_zero(op, i);
}

} // namespace qv::detail
