#include "tradeloop/monitor/trade_journal.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tradeloop {

TradeJournal::TradeJournal(std::size_t history_capacity)
    : history_capacity_(std::max<std::size_t>(history_capacity, 1)) {}

void TradeJournal::associateDecisionToTrade(const std::string& decision_id,
                                            const std::string& asset_pair,
                                            const std::string& trade_id) {
  std::lock_guard lock(mutex_);
  associations_[trade_id] = TradeAssociation{decision_id, asset_pair};
}

std::vector<domain::ClosedTrade> TradeJournal::drainClosedTrades() {
  std::lock_guard lock(mutex_);
  std::vector<domain::ClosedTrade> out;
  out.swap(pending_closed_);
  return out;
}

void TradeJournal::reportClosed(domain::ClosedTrade trade) {
  std::lock_guard lock(mutex_);
  auto it = associations_.find(trade.trade_id);
  if (it != associations_.end() && trade.decision_id.empty()) {
    trade.decision_id = it->second.decision_id;
  }
  pending_closed_.push_back(std::move(trade));
}

void TradeJournal::recordTradeOutcome(const domain::ClosedTrade& trade) {
  std::lock_guard lock(mutex_);
  realized_pnl_ += trade.realized_pnl;
  if (trade.realized_pnl > 0.0) {
    ++wins_;
  } else if (trade.realized_pnl < 0.0) {
    ++losses_;
  }

  trades_.push_back(trade);
  if (trades_.size() > history_capacity_) {
    trades_.pop_front();
  }

  std::cout << "[TradeJournal] closed " << trade.trade_id << " "
            << trade.asset_pair << " pnl=" << trade.realized_pnl
            << " (decision " << trade.decision_id << ")\n";
}

void TradeJournal::recordCycleOutcome(const domain::CycleOutcome& outcome) {
  std::lock_guard lock(mutex_);
  cycles_.push_back(outcome);
  if (cycles_.size() > history_capacity_) {
    cycles_.pop_front();
  }
}

void TradeJournal::recordRecoveredPosition(const std::string& decision_id,
                                           const domain::Position& position) {
  std::lock_guard lock(mutex_);
  associations_[position.id] =
      TradeAssociation{decision_id, position.asset_pair};
  recovered_.push_back(RecoveredEntry{decision_id, position});

  std::cout << "[TradeJournal] recovered " << position.id << " "
            << position.asset_pair << " size=" << position.size
            << " entry=" << position.entry_price << " (decision "
            << decision_id << ")\n";
}

std::optional<TradeAssociation> TradeJournal::associationFor(
    const std::string& trade_id) const {
  std::lock_guard lock(mutex_);
  auto it = associations_.find(trade_id);
  if (it == associations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::ClosedTrade> TradeJournal::trades() const {
  std::lock_guard lock(mutex_);
  return {trades_.begin(), trades_.end()};
}

std::vector<domain::CycleOutcome> TradeJournal::cycleOutcomes() const {
  std::lock_guard lock(mutex_);
  return {cycles_.begin(), cycles_.end()};
}

std::vector<RecoveredEntry> TradeJournal::recoveredPositions() const {
  std::lock_guard lock(mutex_);
  return recovered_;
}

double TradeJournal::realizedPnl() const {
  std::lock_guard lock(mutex_);
  return realized_pnl_;
}

std::size_t TradeJournal::winningTrades() const {
  std::lock_guard lock(mutex_);
  return wins_;
}

std::size_t TradeJournal::losingTrades() const {
  std::lock_guard lock(mutex_);
  return losses_;
}

}  // namespace tradeloop
