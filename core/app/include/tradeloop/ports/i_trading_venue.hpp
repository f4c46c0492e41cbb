#pragma once

#include "tradeloop/domain/order.hpp"
#include "tradeloop/domain/portfolio.hpp"
#include "tradeloop/domain/position.hpp"

#include <map>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ITradingVenue — account and order operations on a trading venue
// -----------------------------------------------------------------------------
//
// @brief  Narrow port used by Perception (portfolio), ExecutionStage (orders)
//         and RecoveryManager (reconciliation).
//
// @details
// The venue is the source of truth for positions and balance. All methods
// may throw on transport failure; all are called under BoundedCaller.
//
//   getPositions()   — open positions right now.
//   getBalance()     — equity and free margin.
//   getReturns()     — recent periodic returns for the given pairs, used by
//                      correlation and VaR checks. Venues without history
//                      return an empty map; the checks then skip.
//   submitOrder()    — one market order. OrderResult::success means filled.
//   closePosition()  — flatten one position.
//
// Thread model: Called from BoundedCaller workers. submitOrder() is never
// retried, but a call that timed out may complete after the agent has
// already released its reservation; the next startup recovery reconciles.
// -----------------------------------------------------------------------------
class ITradingVenue {
 public:
  virtual ~ITradingVenue() = default;

  virtual std::vector<domain::Position> getPositions() = 0;

  virtual domain::Balance getBalance() = 0;

  virtual std::map<std::string, std::vector<double>> getReturns(
      const std::vector<std::string>& asset_pairs) = 0;

  virtual domain::OrderResult submitOrder(
      const domain::OrderRequest& request) = 0;

  virtual domain::OrderResult closePosition(
      const domain::Position& position) = 0;
};

}  // namespace tradeloop
