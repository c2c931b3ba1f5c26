#pragma once
#include <cstddef>
#include <utility>

#include "qv/parallel/parallel_for.hpp"

namespace qv::parallel {

// body(i) for every i in [0, n); each i is visited exactly once.
template <class Fn>
inline void transform(std::size_t n, std::size_t grain, Fn&& body) {
  parallel_for(n, grain, [&](std::size_t i0, std::size_t i1) {
    for (std::size_t i = i0; i < i1; ++i) body(i);
  });
}

// Row launcher for output-partitioned matrix kernels: body(row) writes only
// to its own output row, so results match a serial loop exactly.
template <class Fn>
inline void for_rows(std::size_t rows, Fn&& body) {
  transform(rows, /*grain=*/1, std::forward<Fn>(body));
}

} // namespace qv::parallel
