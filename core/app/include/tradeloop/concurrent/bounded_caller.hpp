#pragma once

#include "tradeloop/domain/retry_policy.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace tradeloop {

enum class CallFailure : std::uint8_t { None, Timeout, Error };

// -----------------------------------------------------------------------------
// CallOutcome<T> — result of a bounded collaborator call
// -----------------------------------------------------------------------------
//
// @brief  Either a value, or the single "exhausted" outcome carrying the
//         last failure.
//
// @details
// Callers never see individual retries. They branch on ok() and map the
// exhausted case to their stage's fallback transition (empty positions in
// recovery, Idle in Perception, a released reservation in Execution).
// -----------------------------------------------------------------------------
template <typename T>
struct CallOutcome {
  std::optional<T> value;
  int attempts{0};
  CallFailure last_failure{CallFailure::None};
  std::string error;

  // The last attempt's result when that attempt timed out. It becomes ready
  // if the worker finishes later; invalid in every other case.
  std::shared_future<T> late;

  bool ok() const { return value.has_value(); }
  bool timedOut() const { return last_failure == CallFailure::Timeout; }
};

// -----------------------------------------------------------------------------
// BoundedCaller — timeouts and retries for calls into external collaborators
// -----------------------------------------------------------------------------
//
// @brief  Runs each attempt of a call on an std::async worker and waits for
//         it no longer than RetryPolicy::timeout.
//
// @details
// Collaborators (venues, data sources, decision providers) are slow and
// occasionally hang. The loop must keep its timing guarantees regardless,
// so every call site goes through call():
//
//   auto outcome = caller.call(policy, [&venue] { return venue.getPositions(); });
//   if (!outcome.ok()) { ... fallback ... }
//
// Attempt lifecycle:
//   1. Sleep RetryPolicy::backoffBefore(attempt).
//   2. Launch the callable on a fresh worker; its result or exception is
//      forwarded through a promise.
//   3. Ready before the timeout → value returned, or the exception message
//      recorded as CallFailure::Error and the next attempt started.
//   4. Not ready → CallFailure::Timeout. The worker keeps running; its
//      future is parked in pending_ instead of being destroyed (destroying
//      an std::async future blocks until the worker finishes). When the
//      final attempt times out, CallOutcome::late still delivers its result
//      for callers that must not lose it (order submission).
//
// Parked workers:
//   Finished ones are reaped at the start of every call(). The destructor
//   waits for the rest, so a worker never outlives the references its
//   callable captured, provided those objects outlive this BoundedCaller.
//   Components therefore declare their BoundedCaller after (destroy before)
//   nothing they reference, and collaborators are owned by the entry point.
//
// Thread model:
//   call() may be invoked from several threads; only pending_ is shared and
//   it is guarded by mutex_. The callable runs on the worker thread and must
//   be safe to run concurrently with a parked earlier attempt.
//
// Exceptions:
//   std::exception from the callable is captured in the outcome. Anything
//   not derived from std::exception propagates out of call().
// -----------------------------------------------------------------------------
class BoundedCaller {
 public:
  explicit BoundedCaller(std::string name) : name_(std::move(name)) {}

  ~BoundedCaller();

  BoundedCaller(const BoundedCaller&) = delete;
  BoundedCaller& operator=(const BoundedCaller&) = delete;
  BoundedCaller(BoundedCaller&&) = delete;
  BoundedCaller& operator=(BoundedCaller&&) = delete;

  // -------------------------------------------------------------------------
  // call(policy, fn)
  // -------------------------------------------------------------------------
  // @param  policy  Attempts, per-attempt timeout, backoff schedule.
  //                 max_attempts below 1 is treated as 1.
  // @param  fn      Copyable callable returning a non-void value. Copied
  //                 into each worker.
  // @return CallOutcome with the first successful value, or exhausted.
  //
  // Side-effects: Logs each failed attempt to std::cerr.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto call(const domain::RetryPolicy& policy, Fn fn)
      -> CallOutcome<std::invoke_result_t<Fn&>>;

  // Workers that timed out and have not finished yet.
  std::size_t pendingCount();

  // Blocks until every parked worker has finished.
  void waitForPending();

 private:
  void park(std::future<void> worker);
  void reapFinished();

  const std::string name_;
  std::mutex mutex_;
  std::vector<std::future<void>> pending_;
};

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------
template <typename Fn>
auto BoundedCaller::call(const domain::RetryPolicy& policy, Fn fn)
    -> CallOutcome<std::invoke_result_t<Fn&>> {
  using T = std::invoke_result_t<Fn&>;
  static_assert(!std::is_void_v<T>, "bounded calls must return a value");

  CallOutcome<T> outcome;
  const int max_attempts = std::max(1, policy.max_attempts);

  reapFinished();

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto delay = policy.backoffBefore(attempt);
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    outcome.attempts = attempt;

    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> result = promise->get_future();

    // The worker forwards whatever fn throws to the promise; the waiting
    // side decides what to do with it below.
    std::future<void> worker =
        std::async(std::launch::async, [promise, fn]() mutable {
          try {
            promise->set_value(fn());
          } catch (...) {
            promise->set_exception(std::current_exception());
          }
        });

    if (result.wait_for(policy.timeout) != std::future_status::ready) {
      outcome.last_failure = CallFailure::Timeout;
      outcome.error = "timed out after " +
                      std::to_string(policy.timeout.count()) + " ms";
      std::cerr << "[" << name_ << "] attempt " << attempt << "/"
                << max_attempts << " " << outcome.error << "\n";
      outcome.late = result.share();
      park(std::move(worker));
      continue;
    }

    outcome.late = std::shared_future<T>{};
    worker.wait();

    try {
      outcome.value.emplace(result.get());
      outcome.last_failure = CallFailure::None;
      outcome.error.clear();
      return outcome;
    } catch (const std::exception& e) {
      outcome.last_failure = CallFailure::Error;
      outcome.error = e.what();
      std::cerr << "[" << name_ << "] attempt " << attempt << "/"
                << max_attempts << " failed: " << outcome.error << "\n";
    }
  }

  return outcome;
}

}  // namespace tradeloop
