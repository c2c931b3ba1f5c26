#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

// Python sees plain lists; these move between list-shaped std containers
// (handled by pybind11/stl.h) and the qv value types.

namespace qvpy {

using List = std::vector<double>;
using Nested = std::vector<std::vector<double>>;

inline qv::Vector<double> vec(const List& xs) { return qv::Vector<double>(xs); }
inline qv::Matrix<double> mat(const Nested& rows) { return qv::Matrix<double>(rows); }

inline List list(qv::Vector<double> v) { return std::move(v).values(); }
inline Nested nested(const qv::Matrix<double>& m) { return m.to_nested(); }

} // namespace qvpy
