#include "qv/core/checks.hpp"
#include "qv/core/log.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace qv::detail {

template <class E>
[[noreturn]] static void raise(std::string msg) {
  QV_LOG_DEBUG("raising: {}", msg);
  throw E(msg);
}

void require_same_length(const char* op, std::size_t lhs, std::size_t rhs) {
  if (lhs != rhs) raise<DimensionMismatch>(fmt::format("{}: length mismatch ({} vs {})", op, lhs, rhs));
}

void require_length(const char* op, const char* what, std::size_t expected, std::size_t got) {
  if (expected != got)
    raise<DimensionMismatch>(fmt::format("{}: {} mismatch (expected {}, got {})", op, what, expected, got));
}

void require_non_empty(const char* op, std::size_t n, const char* what) {
  if (n == 0) raise<EmptyInput>(fmt::format("{}: {} must not be empty", op, what));
}

void require_index(const char* op, std::size_t index, std::size_t bound, const char* what) {
  if (index >= bound)
    raise<std::out_of_range>(fmt::format("{}: {} {} out of range [0, {})", op, what, index, bound));
}

void throw_dimension_mismatch(const char* op, const char* reason) {
  raise<DimensionMismatch>(fmt::format("{}: {}", op, reason));
}

void throw_division_by_zero(const char* op, std::size_t index) {
  raise<DivisionByZero>(fmt::format("{}: division by zero at index {}", op, index));
}

void throw_division_by_zero(const char* op) {
  raise<DivisionByZero>(fmt::format("{}: division by zero", op));
}

void throw_zero_vector(const char* op, const char* which) {
  raise<ZeroVector>(fmt::format("{}: {} has zero magnitude", op, which));
}

void throw_ragged(const char* op, std::size_t row, std::size_t expected, std::size_t got) {
  raise<DimensionMismatch>(
      fmt::format("{}: ragged matrix (row {} has {} columns, expected {})", op, row, got, expected));
}

} // namespace qv::detail
