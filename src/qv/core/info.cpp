#include "qv/core/info.hpp"
#include "qv/core/shape.hpp"
#include "qv/core/traits.hpp"
#include "qv/ops/stats.hpp"
#include "../instantiate.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace qv {

template <> const char* type_name<int>() { return "int"; }
template <> const char* type_name<long>() { return "long"; }
template <> const char* type_name<long long>() { return "long long"; }
template <> const char* type_name<float>() { return "float"; }
template <> const char* type_name<double>() { return "double"; }

template <class T>
std::string info(const Vector<T>& v) {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  fmt::format_to(out, "Array Information:\n");
  fmt::format_to(out, "Count: {}\n", v.size());
  fmt::format_to(out, "Shape: [{}]\n", fmt::join(shape(v), ", "));
  fmt::format_to(out, "Type: {}\n", type_name<T>());
  if (v.empty()) return fmt::to_string(buf);

  if constexpr (is_floating_v<T>) {
    fmt::format_to(out, "Mean: {}\n", *mean(v));
    fmt::format_to(out, "Min: {}\n", *min(v));
    fmt::format_to(out, "Max: {}\n", *max(v));
  }
  const std::size_t preview = std::min<std::size_t>(5, v.size());
  fmt::format_to(out, "\nFirst {} items:\n", preview);
  for (std::size_t i = 0; i < preview; ++i) fmt::format_to(out, "[{}]: {}\n", i, v[i]);
  return fmt::to_string(buf);
}

template <class T>
std::string info(const Matrix<T>& m) {
  return fmt::format("Matrix Information:\nRows: {}\nShape: [{}]\nType: {}\nRagged: {}\n", m.row_count(),
                     fmt::join(shape(m), ", "), type_name<T>(), m.is_ragged() ? "yes" : "no");
}

#define QV_INSTANTIATE_INFO(T)                           \
  template std::string info<T>(const Vector<T>&);        \
  template std::string info<T>(const Matrix<T>&);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_INFO)

} // namespace qv
