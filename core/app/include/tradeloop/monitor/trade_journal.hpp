#pragma once

#include "tradeloop/domain/cycle_outcome.hpp"
#include "tradeloop/domain/position.hpp"
#include "tradeloop/ports/i_portfolio_memory.hpp"
#include "tradeloop/ports/i_trade_monitor.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// Which decision opened a trade.
struct TradeAssociation {
  std::string decision_id;
  std::string asset_pair;
};

// A position adopted at startup and the synthetic decision it runs under.
struct RecoveredEntry {
  std::string decision_id;
  domain::Position position;
};

// -----------------------------------------------------------------------------
// TradeJournal — in-memory trade monitor and portfolio memory
// -----------------------------------------------------------------------------
//
// @brief  Tracks which decision opened which trade, buffers closed trades
//         until the agent's Learning stage drains them, and keeps the
//         learning record (closed trades and cycle outcomes).
//
// @details
// Flow:
//   ExecutionStage / RecoveryManager → associateDecisionToTrade()
//   RecoveryManager                  → recordRecoveredPosition()
//   venue close listener             → reportClosed()
//   Learning stage                   → drainClosedTrades()
//                                    → recordTradeOutcome() per trade
//                                    → recordCycleOutcome() per cycle
//
// reportClosed() fills in the decision id from the association when the
// venue did not carry one. Both histories are bounded by history_capacity;
// the oldest entries are dropped first.
//
// Thread model:
//   All methods lock mutex_. reportClosed() is called from whatever thread
//   closed the position (the venue's caller).
// -----------------------------------------------------------------------------
class TradeJournal final : public ITradeMonitor, public IPortfolioMemory {
 public:
  explicit TradeJournal(std::size_t history_capacity = 1000);

  TradeJournal(const TradeJournal&) = delete;
  TradeJournal& operator=(const TradeJournal&) = delete;

  // ITradeMonitor
  void associateDecisionToTrade(const std::string& decision_id,
                                const std::string& asset_pair,
                                const std::string& trade_id) override;
  std::vector<domain::ClosedTrade> drainClosedTrades() override;

  // IPortfolioMemory
  void recordTradeOutcome(const domain::ClosedTrade& trade) override;
  void recordCycleOutcome(const domain::CycleOutcome& outcome) override;
  void recordRecoveredPosition(const std::string& decision_id,
                               const domain::Position& position) override;

  void reportClosed(domain::ClosedTrade trade);

  std::optional<TradeAssociation> associationFor(
      const std::string& trade_id) const;

  std::vector<domain::ClosedTrade> trades() const;
  std::vector<domain::CycleOutcome> cycleOutcomes() const;
  std::vector<RecoveredEntry> recoveredPositions() const;

  double realizedPnl() const;
  std::size_t winningTrades() const;
  std::size_t losingTrades() const;

 private:
  const std::size_t history_capacity_;

  mutable std::mutex mutex_;
  std::map<std::string, TradeAssociation> associations_;  // by trade id
  std::vector<domain::ClosedTrade> pending_closed_;
  std::deque<domain::ClosedTrade> trades_;
  std::deque<domain::CycleOutcome> cycles_;
  std::vector<RecoveredEntry> recovered_;
  double realized_pnl_{0.0};
  std::size_t wins_{0};
  std::size_t losses_{0};
};

}  // namespace tradeloop
