#pragma once
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "qv/core/log.hpp"
#include "qv/parallel/config.hpp"

// Process-wide worker pool behind parallel_for. Started lazily on first
// submit; QV_NUM_THREADS overrides its size. The first exception thrown by
// any task is rethrown from wait_for_all() and the queued backlog dropped.
// The queue is shared: a throwing task also drops work other threads
// queued, and its error reaches whichever thread waits first. Code sharing
// the pool catches inside its tasks, as parallel_for does.

namespace qv::parallel {

inline thread_local std::size_t tls_worker_id = static_cast<std::size_t>(-1);

namespace detail {

using RangeFn = std::function<void(std::size_t, std::size_t)>;

struct RangeTask {
  RangeFn fn;
  std::size_t begin{0}, end{0};
};

class ThreadPool {
public:
  ThreadPool() = default;
  ~ThreadPool() { shutdown(); }
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void init(std::size_t nthreads = 0) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!workers_.empty()) return;
    std::size_t n = nthreads ? nthreads : std::min(hardware_threads(), get_max_threads());
    n = env_count("QV_NUM_THREADS", n);
    if (n == 0) n = 1;
    stop_ = false;
    inflight_ = 0;
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      workers_.emplace_back([this, i] {
        tls_worker_id = i;
        run();
      });
    }
    QV_LOG_DEBUG("parallel: started pool with {} worker(s) (cap {})", n, get_max_threads());
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (workers_.empty()) return;
      stop_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_)
      if (t.joinable()) t.join();
    std::lock_guard<std::mutex> lk(mu_);
    workers_.clear();
    tasks_.clear();
    inflight_ = 0;
    error_ = nullptr;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return workers_.size();
  }

  void submit(std::size_t begin, std::size_t end, RangeFn fn) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      tasks_.push_back(RangeTask{std::move(fn), begin, end});
      ++inflight_;
    }
    work_cv_.notify_one();
  }

  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    done_cv_.wait(lk, [this] { return inflight_ == 0; });
    if (error_) {
      auto ex = std::exchange(error_, nullptr);
      lk.unlock();
      std::rethrow_exception(ex);
    }
  }

private:
  void run() {
    for (;;) {
      RangeTask task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        work_cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
        if (tasks_.empty()) return;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      std::exception_ptr failure;
      try {
        NestedParallelGuard nested;
        task.fn(task.begin, task.end);
      } catch (...) {
        failure = std::current_exception();
      }
      finish(failure);
    }
  }

  void finish(std::exception_ptr failure) {
    std::lock_guard<std::mutex> lk(mu_);
    if (failure) {
      if (!error_) error_ = std::move(failure);
      // drop the backlog; its tasks count as finished
      inflight_ -= tasks_.size();
      tasks_.clear();
    }
    if (--inflight_ == 0) done_cv_.notify_all();
  }

  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable done_cv_;
  std::deque<RangeTask> tasks_;
  std::vector<std::thread> workers_;
  bool stop_{true};
  std::size_t inflight_{0};
  std::exception_ptr error_;
};

inline ThreadPool& pool() {
  static ThreadPool p;
  return p;
}

} // namespace detail

inline void init_pool(std::size_t n_threads = 0) { detail::pool().init(n_threads); }
inline void shutdown_pool() { detail::pool().shutdown(); }
inline std::size_t pool_size() { return detail::pool().size(); }

// Worker index of the calling thread; 0 outside the pool.
inline std::size_t thread_index() noexcept {
  return tls_worker_id == static_cast<std::size_t>(-1) ? 0 : tls_worker_id;
}

inline void submit_range(std::size_t begin, std::size_t end, detail::RangeFn fn) {
  detail::pool().init();
  detail::pool().submit(begin, end, std::move(fn));
}

inline void wait_for_all() { detail::pool().wait(); }

} // namespace qv::parallel
