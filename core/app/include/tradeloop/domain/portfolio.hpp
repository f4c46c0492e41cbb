#pragma once

#include "tradeloop/domain/position.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {
namespace domain {

// Account balance as reported by the venue.
struct Balance {
  double equity{0.0};
  double free_margin{0.0};
  std::string currency{"USD"};
};

// -----------------------------------------------------------------------------
// PortfolioSnapshot — positions and balance fetched during Perception
// -----------------------------------------------------------------------------
//
// @brief  Everything the RiskGatekeeper needs to know about the account.
//
// @details
// balance is optional: when the venue cannot report it the cycle runs in
// signal-only mode (decisions are produced and recorded, never executed).
//
// returns_by_asset holds periodic returns for assets with open exposure,
// oldest first, keyed by asset pair. The candidate asset's own series comes
// from the MarketSnapshot.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  std::vector<Position> positions;
  std::optional<Balance> balance;
  std::map<std::string, std::vector<double>> returns_by_asset;
  std::int64_t collected_at_ms{0};

  double totalUnrealizedPnl() const {
    double total = 0.0;
    for (const auto& p : positions) {
      total += p.unrealized_pnl;
    }
    return total;
  }
};

}  // namespace domain
}  // namespace tradeloop
