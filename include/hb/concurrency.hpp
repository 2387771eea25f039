#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>

namespace hb {

// Stop flag shared between the signal handler, the monitor and the workers.
// cancel() is a single lock-free store, so it may be called from a signal
// handler.
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

static_assert(std::atomic<bool>::is_always_lock_free);

// Fixed set of threads named "hb-worker-N". Tasks are expected to be long
// lived (one request loop each) but short ones work too. A task that throws
// sets the pool's cancel flag so its siblings can wind down.
class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  int size() const;

  // false once the pool is shutting down
  bool submit(std::function<void()> task);
  bool submit_cancelable(std::function<void(const std::atomic<bool>&)> task);

  // Blocks until nothing is queued or running
  void wait_idle();

  void cancel();
  const std::atomic<bool>& cancel_flag() const;

  // First exception thrown by a task, nullptr if none
  std::exception_ptr first_exception() const;
  size_t failed_tasks() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace hb
