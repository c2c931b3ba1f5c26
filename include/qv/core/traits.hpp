#pragma once
#include <type_traits>

namespace qv {

// Blocks deduction on scalar operands so `v - 10` works for Vector<double>.
template <class T> struct type_identity { using type = T; };
template <class T> using scalar_t = typename type_identity<T>::type;

template <class T>
inline constexpr bool is_floating_v = std::is_floating_point<T>::value;

} // namespace qv
