#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, prefixed, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces ids of the form "<prefix>-<n>" with n starting at 1.
//
// @details
// Each component that mints ids owns its own generator:
//   ExposureLedger   → "RSV-1", "RSV-2", ...
//   TradingAgent     → "DEC-1", ... for decisions that arrive without an id
//   MockTradingVenue → "TRD-1", ...
//
// No global counter: two ledgers in the same process (tests) each start at
// 1, and ids are only required to be unique within their owner.
//
// Thread model:
//   next() may be called concurrently. fetch_add(relaxed) is enough because
//   uniqueness is the only requirement.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::string next() {
    return prefix_ + "-" + std::to_string(nextValue());
  }

  std::uint64_t nextValue() {
    return next_value_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_value_{1};
};

}  // namespace tradeloop
