#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace qv::parallel {

namespace detail {

inline std::size_t hardware_threads() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw ? static_cast<std::size_t>(hw) : 4;
}

// Unsigned decimal from the environment; `fallback` when unset or malformed.
inline std::size_t env_count(const char* name, std::size_t fallback) {
  const char* s = std::getenv(name);
  if (!s || !*s) return fallback;
  std::size_t v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return fallback;
    v = v * 10 + static_cast<std::size_t>(*p - '0');
  }
  return v ? v : 1;
}

inline bool env_flag(const char* name, bool fallback) {
  const char* s = std::getenv(name);
  if (!s) return fallback;
  if (!std::strcmp(s, "1") || !std::strcmp(s, "true") || !std::strcmp(s, "TRUE")) return true;
  if (!std::strcmp(s, "0") || !std::strcmp(s, "false") || !std::strcmp(s, "FALSE")) return false;
  return fallback;
}

inline std::atomic<std::size_t>& threads_cap() {
  static std::atomic<std::size_t> cap{env_count("QV_THREADS", hardware_threads())};
  return cap;
}

inline std::atomic<bool>& deterministic_flag() {
  static std::atomic<bool> on{env_flag("QV_DETERMINISTIC", false)};
  return on;
}

inline int& serial_depth() { static thread_local int d = 0; return d; }
inline bool& in_worker() { static thread_local bool f = false; return f; }

} // namespace detail

// Upper bound on threads a single parallel_for may use (QV_THREADS).
inline void set_max_threads(std::size_t n) {
  detail::threads_cap().store(n ? n : 1, std::memory_order_relaxed);
}
inline std::size_t get_max_threads() {
  return detail::threads_cap().load(std::memory_order_relaxed);
}

// QV_DETERMINISTIC=1 forces every region onto the calling thread.
inline void set_deterministic(bool on) {
  detail::deterministic_flag().store(on, std::memory_order_relaxed);
}
inline bool deterministic_enabled() {
  return detail::deterministic_flag().load(std::memory_order_relaxed);
}

// Runs every parallel region opened on this thread serially while alive.
struct ScopedSerial {
  ScopedSerial() { ++detail::serial_depth(); }
  ~ScopedSerial() { --detail::serial_depth(); }
  ScopedSerial(const ScopedSerial&) = delete;
  ScopedSerial& operator=(const ScopedSerial&) = delete;
  static int depth() { return detail::serial_depth(); }
};

// Marks the current thread as executing pool work; nested regions go serial.
struct NestedParallelGuard {
  NestedParallelGuard() : prev_(detail::in_worker()) { detail::in_worker() = true; }
  ~NestedParallelGuard() { detail::in_worker() = prev_; }
  NestedParallelGuard(const NestedParallelGuard&) = delete;
  NestedParallelGuard& operator=(const NestedParallelGuard&) = delete;
  static bool active() { return detail::in_worker(); }
private:
  bool prev_;
};

inline bool serial_override() {
  return ScopedSerial::depth() > 0
      || NestedParallelGuard::active()
      || deterministic_enabled()
      || get_max_threads() <= 1;
}

} // namespace qv::parallel
