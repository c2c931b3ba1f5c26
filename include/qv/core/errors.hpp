#pragma once
#include <stdexcept>
#include <string>

namespace qv {

// Operand lengths/shapes violate an op's precondition (vector lengths,
// matrix rows/cols, ragged rows, mask vs. source length).
class DimensionMismatch : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Element-wise or scalar division by an exact zero.
class DivisionByZero : public std::domain_error {
public:
  using std::domain_error::domain_error;
};

// Normalization, cosine or projection against a zero-magnitude vector.
class ZeroVector : public std::domain_error {
public:
  using std::domain_error::domain_error;
};

// Op that needs at least one element (identity(0), diag([]), ...).
class EmptyInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace qv
