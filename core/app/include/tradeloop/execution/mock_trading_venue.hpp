#pragma once

#include "tradeloop/concurrent/id_generator.hpp"
#include "tradeloop/ports/i_trading_venue.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// MockTradingVenue — in-process paper venue with perfect fills
// -----------------------------------------------------------------------------
//
// @brief  ITradingVenue implementation that fills every affordable order
//         immediately at the request's reference price, with zero slippage
//         and no fees.
//
// @details
// Lets the agent executable run end-to-end without a real venue ("paper"
// mode) and gives integration tests a venue with real position accounting.
//
// Accounting (leverage 1):
//   - Opening or adding:  free_margin -= notional. Rejected with
//                         "insufficient margin" if notional > free_margin.
//   - Opposite order:     reduces the open position first; realized P&L is
//                         booked to equity and margin is returned. Any
//                         remainder opens a position on the other side.
//   - closePosition():    flattens the position at its mark price.
//
// updateMark() moves the mark price for a pair, recomputes unrealized P&L
// and appends the period's return to the pair's history, which getReturns()
// reports for the correlation / VaR checks.
//
// Every fully closed position is reported to the close listener, if set,
// as a domain::ClosedTrade (main wires it to TradeJournal).
//
// Thread model:
//   All methods lock mutex_. The close listener runs while the lock is NOT
//   held, on the thread that closed the position.
// -----------------------------------------------------------------------------
class MockTradingVenue final : public ITradingVenue {
 public:
  using CloseListener = std::function<void(const domain::ClosedTrade&)>;

  MockTradingVenue(const ITimeProvider& time_provider,
                   domain::Balance initial_balance,
                   std::size_t max_return_history = 256);

  MockTradingVenue(const MockTradingVenue&) = delete;
  MockTradingVenue& operator=(const MockTradingVenue&) = delete;

  std::vector<domain::Position> getPositions() override;
  domain::Balance getBalance() override;
  std::map<std::string, std::vector<double>> getReturns(
      const std::vector<std::string>& asset_pairs) override;
  domain::OrderResult submitOrder(const domain::OrderRequest& request) override;
  domain::OrderResult closePosition(const domain::Position& position) override;

  void updateMark(const std::string& asset_pair, double price);

  void setCloseListener(CloseListener listener);

 private:
  struct OpenPosition {
    domain::Position position;
    std::string trade_id;
    std::string decision_id;
  };

  // Realizes pnl and releases margin for `units` of an open position.
  // Caller holds mutex_. Returns realized P&L.
  double reduceLocked(OpenPosition& open, double units, double price);

  domain::ClosedTrade closedTradeFrom(const OpenPosition& open, double units,
                                      double exit_price, double pnl) const;

  void notifyClosed(const std::vector<domain::ClosedTrade>& closed);

  const ITimeProvider& time_provider_;
  const std::size_t max_return_history_;

  IdGenerator trade_ids_{"TRD"};
  IdGenerator position_ids_{"POS"};

  std::mutex mutex_;
  domain::Balance balance_;
  std::map<std::string, OpenPosition> positions_;  // keyed by asset pair
  std::map<std::string, double> marks_;
  std::map<std::string, std::vector<double>> returns_;
  CloseListener close_listener_;
};

}  // namespace tradeloop
