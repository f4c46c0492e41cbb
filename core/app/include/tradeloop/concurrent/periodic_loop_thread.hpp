#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace tradeloop {

// -----------------------------------------------------------------------------
// PeriodicLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that calls a step function over and
// over. When the step reports it has nothing more to do right now, the
// worker sleeps for the configured interval or until wake() / stop().
//
// AgentRuntime drives TradingAgent::tick() with it: a cycle's stages run
// back-to-back, then the worker waits out the analysis interval in Idle.
// An operator TRIGGER command calls wake() to start the next cycle early.
//
// Thread model: start(), stop() and wake() may be called from any thread.
// The step function runs only on the worker thread and must not throw; an
// escaping exception terminates the process (std::thread semantics).
// stop() never interrupts a step, it waits for the current one to return.
// -----------------------------------------------------------------------------
class PeriodicLoopThread {
 public:
  // Returns true when another step should run immediately.
  using Step = std::function<bool()>;

  PeriodicLoopThread(Step step, std::chrono::milliseconds interval);

  ~PeriodicLoopThread();

  PeriodicLoopThread(const PeriodicLoopThread&) = delete;
  PeriodicLoopThread& operator=(const PeriodicLoopThread&) = delete;
  PeriodicLoopThread(PeriodicLoopThread&&) = delete;
  PeriodicLoopThread& operator=(PeriodicLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Blocks until the current step returns and the worker exits.
  void stop();

  // Ends the current idle wait early. A wake() while a step is running
  // skips the next wait.
  void wake();

  bool running() const { return running_.load(); }

 private:
  void run();

  Step step_;
  const std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  bool wake_requested_{false};  // guarded by wait_mutex_

  std::thread thread_;
};

}  // namespace tradeloop
