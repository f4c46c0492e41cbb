#pragma once

#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/portfolio.hpp"

#include <optional>

namespace tradeloop {

struct SizingSettings {
  double risk_per_trade{0.01};         // fraction of equity risked per trade
  double default_stop_loss{0.02};      // used when the decision has none
  double max_position_fraction{0.10};  // cap: notional / equity
};

// -----------------------------------------------------------------------------
// PositionSizer — how many units to trade for an approved direction
// -----------------------------------------------------------------------------
//
// @brief  Size in base-asset units for a Decision at a reference price.
//
// @details
//   1. Decision carries recommended_position_size > 0 → use it, capped.
//   2. Otherwise risk-based:
//        units = equity * risk_per_trade / (price * stop_loss)
//      so that hitting the stop loses risk_per_trade of equity.
//   3. Cap at max_position_fraction * equity / price.
//
// Returns 0 for Hold, for a missing balance, or for a non-positive price or
// equity. The agent treats 0 as "skip" (policy outcome, no cooldown).
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(SizingSettings settings) : settings_(settings) {}

  double size(const domain::Decision& decision, double price,
              const std::optional<domain::Balance>& balance) const;

  const SizingSettings& settings() const { return settings_; }

 private:
  SizingSettings settings_;
};

}  // namespace tradeloop
