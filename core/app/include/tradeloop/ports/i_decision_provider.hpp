#pragma once

#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/market_snapshot.hpp"
#include "tradeloop/domain/portfolio.hpp"

#include <optional>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IDecisionProvider — the reasoning collaborator
// -----------------------------------------------------------------------------
//
// @brief  Turns a snapshot (and portfolio context when available) into a
//         proposed Decision.
//
// @details
// Return values:
//   - a Decision            → proposal for snapshot.asset_pair.
//   - std::nullopt          → a clear "no decision available". Not a failure;
//                             the agent returns to Idle without counting it.
//   - throw std::exception  → failure. Counts towards the per-pair analysis
//                             failure limit.
//
// portfolio is std::nullopt when positions / balance could not be fetched.
//
// Thread model: Called from BoundedCaller workers.
// -----------------------------------------------------------------------------
class IDecisionProvider {
 public:
  virtual ~IDecisionProvider() = default;

  virtual std::optional<domain::Decision> proposeDecision(
      const domain::MarketSnapshot& snapshot,
      const std::optional<domain::PortfolioSnapshot>& portfolio) = 0;
};

}  // namespace tradeloop
