// =============================================================================
// test_doubles.hpp
// =============================================================================
// Hand-written fakes of the agent's ports, shared by the unit and integration
// tests. Each fake records what it was asked and can be scripted to fail,
// throw or stall. All state is mutex-guarded because the agent calls its
// collaborators from BoundedCaller worker threads.
// =============================================================================

#pragma once

#include "tradeloop/domain/errors.hpp"
#include "tradeloop/ports/i_decision_provider.hpp"
#include "tradeloop/ports/i_market_data_source.hpp"
#include "tradeloop/ports/i_portfolio_memory.hpp"
#include "tradeloop/ports/i_trade_monitor.hpp"
#include "tradeloop/ports/i_trading_venue.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tradeloop::fakes {

// -----------------------------------------------------------------------------
// FakeMarketDataSource
// -----------------------------------------------------------------------------
class FakeMarketDataSource : public IMarketDataSource {
 public:
  domain::MarketSnapshot fetchSnapshot(const std::string& asset_pair) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    if (fail_) {
      throw CollaboratorError("market data down");
    }
    auto it = snapshots_.find(asset_pair);
    if (it == snapshots_.end()) {
      throw CollaboratorError("no snapshot for " + asset_pair);
    }
    return it->second;
  }

  void set(const domain::MarketSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    snapshots_[snapshot.asset_pair] = snapshot;
  }

  void setFailing(bool fail) {
    std::lock_guard lock(mutex_);
    fail_ = fail;
  }

  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, domain::MarketSnapshot> snapshots_;
  bool fail_{false};
  int calls_{0};
};

// -----------------------------------------------------------------------------
// FakeDecisionProvider — returns the scripted decision every time
// -----------------------------------------------------------------------------
class FakeDecisionProvider : public IDecisionProvider {
 public:
  std::optional<domain::Decision> proposeDecision(
      const domain::MarketSnapshot& snapshot,
      const std::optional<domain::PortfolioSnapshot>& portfolio) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    last_had_portfolio_ = portfolio.has_value();
    last_snapshot_pair_ = snapshot.asset_pair;
    if (fail_) {
      throw CollaboratorError("reasoning service unavailable");
    }
    return next_;
  }

  void setDecision(std::optional<domain::Decision> decision) {
    std::lock_guard lock(mutex_);
    next_ = std::move(decision);
  }

  void setFailing(bool fail) {
    std::lock_guard lock(mutex_);
    fail_ = fail;
  }

  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  bool lastHadPortfolio() const {
    std::lock_guard lock(mutex_);
    return last_had_portfolio_;
  }

 private:
  mutable std::mutex mutex_;
  std::optional<domain::Decision> next_;
  bool fail_{false};
  int calls_{0};
  bool last_had_portfolio_{false};
  std::string last_snapshot_pair_;
};

// -----------------------------------------------------------------------------
// FakeTradingVenue
// -----------------------------------------------------------------------------
// Scripting:
//   - failPositionFetches(n): the next n getPositions() calls throw.
//   - setQueriesFailing(true): getPositions / getBalance always throw.
//   - setOrderResult(r): what submitOrder returns.
//   - setOrderDelay(d): submitOrder sleeps d first (timeout tests).
//   - setOrderThrows(true): submitOrder throws.
//   - failCloseOf(id): closePosition for that id returns an error.
// -----------------------------------------------------------------------------
class FakeTradingVenue : public ITradingVenue {
 public:
  FakeTradingVenue() {
    balance_.equity = 100000.0;
    balance_.free_margin = 100000.0;
    order_result_.success = true;
    order_result_.trade_id = "T-1";
  }

  std::vector<domain::Position> getPositions() override {
    std::lock_guard lock(mutex_);
    ++position_fetches_;
    if (queries_fail_) {
      throw CollaboratorError("venue unreachable");
    }
    if (position_fetch_failures_ > 0) {
      --position_fetch_failures_;
      throw CollaboratorError("position fetch failed");
    }
    return positions_;
  }

  domain::Balance getBalance() override {
    std::lock_guard lock(mutex_);
    if (queries_fail_) {
      throw CollaboratorError("venue unreachable");
    }
    return balance_;
  }

  std::map<std::string, std::vector<double>> getReturns(
      const std::vector<std::string>& asset_pairs) override {
    std::lock_guard lock(mutex_);
    std::map<std::string, std::vector<double>> out;
    for (const auto& pair : asset_pairs) {
      auto it = returns_.find(pair);
      if (it != returns_.end()) {
        out.emplace(pair, it->second);
      }
    }
    return out;
  }

  domain::OrderResult submitOrder(const domain::OrderRequest& request) override {
    std::chrono::milliseconds delay;
    {
      std::lock_guard lock(mutex_);
      orders_.push_back(request);
      delay = order_delay_;
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    std::lock_guard lock(mutex_);
    if (order_throws_) {
      throw CollaboratorError("order endpoint error");
    }
    domain::OrderResult r = order_result_;
    if (r.success && r.filled_size == 0.0) {
      r.filled_size = request.size;
      r.fill_price = request.reference_price;
    }
    return r;
  }

  domain::OrderResult closePosition(const domain::Position& position) override {
    std::lock_guard lock(mutex_);
    close_attempts_.push_back(position.id);
    domain::OrderResult r;
    if (failing_closes_.count(position.id) != 0) {
      r.error = "close rejected";
      return r;
    }
    for (auto it = positions_.begin(); it != positions_.end(); ++it) {
      if (it->id == position.id) {
        positions_.erase(it);
        break;
      }
    }
    r.success = true;
    r.trade_id = "CLOSE-" + position.id;
    r.filled_size = position.size;
    r.fill_price = position.markPrice();
    return r;
  }

  // --- scripting -------------------------------------------------------------
  void setPositions(std::vector<domain::Position> positions) {
    std::lock_guard lock(mutex_);
    positions_ = std::move(positions);
  }
  void setBalance(double equity, double free_margin) {
    std::lock_guard lock(mutex_);
    balance_.equity = equity;
    balance_.free_margin = free_margin;
  }
  void setReturns(const std::string& pair, std::vector<double> returns) {
    std::lock_guard lock(mutex_);
    returns_[pair] = std::move(returns);
  }
  void failPositionFetches(int n) {
    std::lock_guard lock(mutex_);
    position_fetch_failures_ = n;
  }
  void setQueriesFailing(bool fail) {
    std::lock_guard lock(mutex_);
    queries_fail_ = fail;
  }
  void setOrderResult(domain::OrderResult result) {
    std::lock_guard lock(mutex_);
    order_result_ = std::move(result);
  }
  void setOrderDelay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    order_delay_ = delay;
  }
  void setOrderThrows(bool value) {
    std::lock_guard lock(mutex_);
    order_throws_ = value;
  }
  void failCloseOf(const std::string& position_id) {
    std::lock_guard lock(mutex_);
    failing_closes_.insert(position_id);
  }

  // --- inspection ------------------------------------------------------------
  std::vector<domain::OrderRequest> orders() const {
    std::lock_guard lock(mutex_);
    return orders_;
  }
  std::vector<std::string> closeAttempts() const {
    std::lock_guard lock(mutex_);
    return close_attempts_;
  }
  int positionFetches() const {
    std::lock_guard lock(mutex_);
    return position_fetches_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<domain::Position> positions_;
  domain::Balance balance_;
  std::map<std::string, std::vector<double>> returns_;
  domain::OrderResult order_result_;
  std::chrono::milliseconds order_delay_{0};
  bool order_throws_{false};
  bool queries_fail_{false};
  int position_fetch_failures_{0};
  int position_fetches_{0};
  std::set<std::string> failing_closes_;
  std::vector<domain::OrderRequest> orders_;
  std::vector<std::string> close_attempts_;
};

// -----------------------------------------------------------------------------
// FakeTradeMonitor
// -----------------------------------------------------------------------------
struct Association {
  std::string decision_id;
  std::string asset_pair;
  std::string trade_id;
};

class FakeTradeMonitor : public ITradeMonitor {
 public:
  void associateDecisionToTrade(const std::string& decision_id,
                                const std::string& asset_pair,
                                const std::string& trade_id) override {
    std::lock_guard lock(mutex_);
    if (throw_on_associate_) {
      throw CollaboratorError("monitor offline");
    }
    associations_.push_back({decision_id, asset_pair, trade_id});
  }

  std::vector<domain::ClosedTrade> drainClosedTrades() override {
    std::lock_guard lock(mutex_);
    std::vector<domain::ClosedTrade> out(closed_.begin(), closed_.end());
    closed_.clear();
    return out;
  }

  void addClosed(domain::ClosedTrade trade) {
    std::lock_guard lock(mutex_);
    closed_.push_back(std::move(trade));
  }
  void setThrowOnAssociate(bool value) {
    std::lock_guard lock(mutex_);
    throw_on_associate_ = value;
  }
  std::vector<Association> associations() const {
    std::lock_guard lock(mutex_);
    return associations_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Association> associations_;
  std::deque<domain::ClosedTrade> closed_;
  bool throw_on_associate_{false};
};

// -----------------------------------------------------------------------------
// FakePortfolioMemory
// -----------------------------------------------------------------------------
class FakePortfolioMemory : public IPortfolioMemory {
 public:
  void recordTradeOutcome(const domain::ClosedTrade& trade) override {
    std::lock_guard lock(mutex_);
    trades_.push_back(trade);
  }
  void recordCycleOutcome(const domain::CycleOutcome& outcome) override {
    std::lock_guard lock(mutex_);
    outcomes_.push_back(outcome);
  }
  void recordRecoveredPosition(const std::string& decision_id,
                               const domain::Position& position) override {
    std::lock_guard lock(mutex_);
    if (throw_on_recovered_) {
      throw CollaboratorError("memory store offline");
    }
    recovered_.push_back({decision_id, position});
  }

  void setThrowOnRecovered(bool value) {
    std::lock_guard lock(mutex_);
    throw_on_recovered_ = value;
  }

  std::vector<domain::ClosedTrade> trades() const {
    std::lock_guard lock(mutex_);
    return trades_;
  }
  std::vector<domain::CycleOutcome> outcomes() const {
    std::lock_guard lock(mutex_);
    return outcomes_;
  }
  std::vector<std::pair<std::string, domain::Position>> recovered() const {
    std::lock_guard lock(mutex_);
    return recovered_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<domain::ClosedTrade> trades_;
  std::vector<domain::CycleOutcome> outcomes_;
  std::vector<std::pair<std::string, domain::Position>> recovered_;
  bool throw_on_recovered_{false};
};

// -----------------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------------
inline domain::Position makePosition(const std::string& id,
                                     const std::string& pair,
                                     double unrealized_pnl,
                                     std::int64_t opened_at_ms,
                                     domain::Side side = domain::Side::Long,
                                     double size = 1.0,
                                     double price = 100.0) {
  domain::Position p;
  p.id = id;
  p.asset_pair = pair;
  p.side = side;
  p.size = size;
  p.entry_price = price;
  p.current_price = price;
  p.unrealized_pnl = unrealized_pnl;
  p.opened_at_ms = opened_at_ms;
  return p;
}

inline domain::Decision makeDecision(const std::string& pair,
                                     domain::Action action,
                                     double confidence,
                                     const std::string& id = "") {
  domain::Decision d;
  d.id = id;
  d.asset_pair = pair;
  d.action = action;
  d.confidence = confidence;
  return d;
}

inline domain::MarketSnapshot makeSnapshot(const std::string& pair,
                                           double price,
                                           std::int64_t collected_at_ms) {
  domain::MarketSnapshot s;
  s.asset_pair = pair;
  s.price = price;
  s.collected_at_ms = collected_at_ms;
  return s;
}

// n returns following a deterministic zig-zag scaled by `scale`.
inline std::vector<double> zigzagReturns(std::size_t n, double scale,
                                         double phase = 0.0) {
  std::vector<double> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double base = (i % 4 == 0)   ? 1.0
                        : (i % 4 == 1) ? -0.5
                        : (i % 4 == 2) ? 0.75
                                       : -1.25;
    out.push_back(scale * (base + phase * static_cast<double>(i % 3)));
  }
  return out;
}

}  // namespace tradeloop::fakes
