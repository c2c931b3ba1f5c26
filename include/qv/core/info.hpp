#pragma once
#include <string>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv {

// Name of a supported element type ("int", "double", ...).
template <class T> const char* type_name();
template <> const char* type_name<int>();
template <> const char* type_name<long>();
template <> const char* type_name<long long>();
template <> const char* type_name<float>();
template <> const char* type_name<double>();

// Multi-line summary: count, shape, element type, mean/min/max for
// floating types, then the first five items.
template <class T> std::string info(const Vector<T>& v);

// Shape and element type of a matrix, flagging ragged rows.
template <class T> std::string info(const Matrix<T>& m);

} // namespace qv
