#include "tradeloop/concurrent/periodic_loop_thread.hpp"

#include <utility>

namespace tradeloop {

PeriodicLoopThread::PeriodicLoopThread(Step step,
                                       std::chrono::milliseconds interval)
    : step_(std::move(step)), interval_(interval) {}

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
// The worker calls step_, which usually captures objects owned by whoever
// owns this thread. Joining here keeps it from running after they are gone.
// -----------------------------------------------------------------------------
PeriodicLoopThread::~PeriodicLoopThread() { stop(); }

void PeriodicLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  {
    // Store under the mutex so the worker cannot miss the notification
    // between checking its predicate and going to sleep.
    std::lock_guard lock(wait_mutex_);
    running_.store(false);
  }
  wait_cv_.notify_all();
  thread_.join();
}

void PeriodicLoopThread::wake() {
  {
    std::lock_guard lock(wait_mutex_);
    wake_requested_ = true;
  }
  wait_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void PeriodicLoopThread::run() {
  while (running_.load()) {
    if (step_()) {
      continue;
    }

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, interval_, [this] {
      return !running_.load() || wake_requested_;
    });
    wake_requested_ = false;
  }
}

}  // namespace tradeloop
