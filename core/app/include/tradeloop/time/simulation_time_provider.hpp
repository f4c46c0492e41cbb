#pragma once

#include "tradeloop/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly rather than
//         read from the system clock.
//
// @details
// Tests use it to put a snapshot exactly two hours in the past, to expire a
// cooldown entry, or to age a reservation past the sweep threshold without
// sleeping. MarketDataGateway can also drive it from the timestamps of
// replayed snapshots when the agent runs against historical data.
//
// Internal storage:
//   std::atomic<int64_t>. Readers are the loop thread and BoundedCaller
//   workers; the writer is the test body or the gateway thread.
//
// Thread model:
//   now_ms(), advance_time() and advance_by() are all atomic.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is not enforced; tests sometimes need to set arbitrary
  // times. The replay feed is responsible for chronological order.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeloop
