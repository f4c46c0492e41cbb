#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// MarketSnapshot — market state for one asset pair at a point in time
// -----------------------------------------------------------------------------
//
// @brief  Immutable input to one decision cycle.
//
// @details
// collected_at_ms is the time the data was observed by the source, not the
// time the agent received it. Freshness is always judged against it:
//
//   age_ms = clock.now_ms() - collected_at_ms
//
// recent_returns holds periodic simple returns, oldest first. RiskGatekeeper
// uses the tail of this series for correlation and historical VaR.
//
// Thread model:
//   Value type, produced on a BoundedCaller worker and handed to the loop
//   thread by value.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string asset_pair;
  double price{0.0};

  // Technical fields.
  double rsi{50.0};
  double volatility{0.0};
  double trend{0.0};

  double sentiment{0.0};  // [-1, 1]

  std::vector<double> recent_returns;

  std::int64_t collected_at_ms{0};
};

}  // namespace domain
}  // namespace tradeloop
