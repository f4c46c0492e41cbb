#pragma once

#include "tradeloop/domain/decision.hpp"

#include <optional>
#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// OrderRequest — what ExecutionStage asks the venue to do
// -----------------------------------------------------------------------------
//
// @brief  Market order derived from an approved Decision.
//
// @details
// action is Buy or Sell; Hold never reaches the venue. reference_price is
// the snapshot price the risk checks were evaluated against. Venues may
// fill at a different price and report it in OrderResult::fill_price.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string decision_id;
  std::string reservation_id;
  std::string asset_pair;
  Action action{Action::Buy};
  double size{0.0};
  double reference_price{0.0};
  std::optional<double> stop_loss_fraction;
};

// -----------------------------------------------------------------------------
// OrderResult — venue response to submitOrder() or closePosition()
// -----------------------------------------------------------------------------
//
// @details
// success == true means the venue confirmed the fill. Any other outcome
// (rejected, unknown) must carry a human-readable error. Transport failures
// are reported by throwing instead.
// -----------------------------------------------------------------------------
struct OrderResult {
  bool success{false};
  std::string trade_id;
  double filled_size{0.0};
  double fill_price{0.0};
  std::string error;
};

}  // namespace domain
}  // namespace tradeloop
