#pragma once

#include "tradeloop/domain/position.hpp"

#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ITradeMonitor — tracks open trades and reports their closure
// -----------------------------------------------------------------------------
//
// associateDecisionToTrade(): called once per committed order and once per
//   position adopted during recovery (with a RECOVERED_... decision id).
// drainClosedTrades(): trades that closed since the last call. Learning
//   calls it once per cycle; each closed trade is returned exactly once.
//
// Called directly from the loop thread, not through BoundedCaller; both
// methods must return promptly.
// -----------------------------------------------------------------------------
class ITradeMonitor {
 public:
  virtual ~ITradeMonitor() = default;

  virtual void associateDecisionToTrade(const std::string& decision_id,
                                        const std::string& asset_pair,
                                        const std::string& trade_id) = 0;

  virtual std::vector<domain::ClosedTrade> drainClosedTrades() = 0;
};

}  // namespace tradeloop
