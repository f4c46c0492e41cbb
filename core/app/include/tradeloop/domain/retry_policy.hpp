#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// RetryPolicy — bounds for one kind of external call
// -----------------------------------------------------------------------------
//
// @brief  Value passed to BoundedCaller::call() at every call site that
//         talks to a collaborator.
//
// @details
//   - max_attempts: total attempts, first one included. 1 means "no retry".
//   - timeout:      per attempt. An attempt that has not returned by then
//                   counts as failed.
//   - backoff:      sleep before attempt N+1 is backoff[N-1]; the last
//                   entry repeats when the schedule is shorter than the
//                   number of retries. Empty means retry immediately.
//
// Order submission always runs with max_attempts == 1: re-sending an order
// whose first attempt timed out could fill twice.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{1};
  std::chrono::milliseconds timeout{5000};
  std::vector<std::chrono::milliseconds> backoff;

  std::chrono::milliseconds backoffBefore(int attempt) const {
    // attempt is 1-based; no wait before the first.
    if (attempt <= 1 || backoff.empty()) {
      return std::chrono::milliseconds{0};
    }
    auto index = static_cast<std::size_t>(attempt - 2);
    if (index >= backoff.size()) {
      index = backoff.size() - 1;
    }
    return backoff[index];
  }

  static RetryPolicy once(std::chrono::milliseconds timeout) {
    RetryPolicy p;
    p.max_attempts = 1;
    p.timeout = timeout;
    return p;
  }
};

}  // namespace domain
}  // namespace tradeloop
