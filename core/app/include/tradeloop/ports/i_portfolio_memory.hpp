#pragma once

#include "tradeloop/domain/cycle_outcome.hpp"
#include "tradeloop/domain/position.hpp"

#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IPortfolioMemory — learning sink
// -----------------------------------------------------------------------------
// Receives completed trades (for provider performance / adaptive weighting,
// which live outside the loop), one CycleOutcome per cycle, and the open
// positions adopted by startup recovery. Called from the loop thread.
// -----------------------------------------------------------------------------
class IPortfolioMemory {
 public:
  virtual ~IPortfolioMemory() = default;

  virtual void recordTradeOutcome(const domain::ClosedTrade& trade) = 0;

  virtual void recordCycleOutcome(const domain::CycleOutcome& outcome) = 0;

  // An open position found on the venue at startup, under its synthetic
  // RECOVERED_* decision id. Closes later arrive through recordTradeOutcome.
  virtual void recordRecoveredPosition(const std::string& decision_id,
                                       const domain::Position& position) = 0;
};

}  // namespace tradeloop
