#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <utility>

#include "qv/parallel/config.hpp"
#include "qv/parallel/pool.hpp"

namespace qv::parallel {

// Splits [0, n) into contiguous blocks and runs body(lo, hi) on the pool.
// Block boundaries depend only on n, grain and the thread cap. Runs inline
// when serial_override() holds or only one block results.
template <class Fn>
inline void parallel_for(std::size_t n, std::size_t grain, Fn&& body) {
  if (n == 0) return;
  const std::size_t threads = std::max<std::size_t>(1, std::min(get_max_threads(), n));
  const std::size_t blocks = grain == 0
      ? threads
      : std::max<std::size_t>(1, std::min(threads, (n + grain - 1) / grain));

  if (blocks == 1 || serial_override()) {
    body(std::size_t{0}, n);
    return;
  }

  std::mutex err_mu;
  std::exception_ptr first_error;
  const std::size_t q = n / blocks, r = n % blocks;
  for (std::size_t k = 0; k < blocks; ++k) {
    const std::size_t lo = k * q + std::min(k, r);
    const std::size_t hi = lo + q + (k < r ? 1 : 0);
    submit_range(lo, hi, [&](std::size_t i0, std::size_t i1) {
      try {
        body(i0, i1);
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = std::current_exception();
      }
    });
  }
  wait_for_all();
  if (first_error) std::rethrow_exception(first_error);
}

template <class Fn>
inline void parallel_for(std::size_t n, Fn&& body) {
  parallel_for(n, /*grain=*/0, std::forward<Fn>(body));
}

} // namespace qv::parallel
