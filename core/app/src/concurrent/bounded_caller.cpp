#include "tradeloop/concurrent/bounded_caller.hpp"

#include <chrono>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Destructor: join every worker that timed out
// -----------------------------------------------------------------------------
BoundedCaller::~BoundedCaller() {
  std::size_t outstanding = pendingCount();
  if (outstanding > 0) {
    std::cerr << "[" << name_ << "] waiting for " << outstanding
              << " timed-out call(s) to finish before shutdown\n";
  }
  waitForPending();
}

std::size_t BoundedCaller::pendingCount() {
  reapFinished();
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void BoundedCaller::waitForPending() {
  std::vector<std::future<void>> workers;
  {
    std::lock_guard lock(mutex_);
    workers.swap(pending_);
  }
  for (auto& worker : workers) {
    worker.wait();
  }
}

void BoundedCaller::park(std::future<void> worker) {
  std::lock_guard lock(mutex_);
  pending_.push_back(std::move(worker));
}

// -----------------------------------------------------------------------------
// reapFinished(): drop futures whose workers have already returned
// -----------------------------------------------------------------------------
void BoundedCaller::reapFinished() {
  std::lock_guard lock(mutex_);
  pending_.erase(
      std::remove_if(pending_.begin(), pending_.end(),
                     [](const std::future<void>& f) {
                       return f.wait_for(std::chrono::seconds(0)) ==
                              std::future_status::ready;
                     }),
      pending_.end());
}

}  // namespace tradeloop
