#pragma once

#include "tradeloop/time/i_time_provider.hpp"

namespace tradeloop {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the agent executable. system_clock (not steady_clock) because the
// values are compared against collected_at_ms stamps produced by other
// processes.
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeloop
