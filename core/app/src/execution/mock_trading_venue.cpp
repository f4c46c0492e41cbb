#include "tradeloop/execution/mock_trading_venue.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace tradeloop {

MockTradingVenue::MockTradingVenue(const ITimeProvider& time_provider,
                                   domain::Balance initial_balance,
                                   std::size_t max_return_history)
    : time_provider_(time_provider),
      max_return_history_(std::max<std::size_t>(max_return_history, 1)),
      balance_(std::move(initial_balance)) {}

std::vector<domain::Position> MockTradingVenue::getPositions() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [pair, open] : positions_) {
    out.push_back(open.position);
  }
  return out;
}

domain::Balance MockTradingVenue::getBalance() {
  std::lock_guard lock(mutex_);
  domain::Balance b = balance_;
  for (const auto& [pair, open] : positions_) {
    b.equity += open.position.unrealized_pnl;
  }
  return b;
}

std::map<std::string, std::vector<double>> MockTradingVenue::getReturns(
    const std::vector<std::string>& asset_pairs) {
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

// -----------------------------------------------------------------------------
// submitOrder(): immediate fill at the reference price
// -----------------------------------------------------------------------------
domain::OrderResult MockTradingVenue::submitOrder(
    const domain::OrderRequest& request) {
  domain::OrderResult result;
  if (request.action == domain::Action::Hold || request.size <= 0.0 ||
      request.reference_price <= 0.0) {
    result.error = "invalid order";
    return result;
  }

  const double price = request.reference_price;
  const domain::Side side = request.action == domain::Action::Buy
                                ? domain::Side::Long
                                : domain::Side::Short;
  std::vector<domain::ClosedTrade> closed;

  {
    std::lock_guard lock(mutex_);
    double remaining = request.size;

    auto it = positions_.find(request.asset_pair);
    if (it != positions_.end() && it->second.position.side != side) {
      const double units = std::min(remaining, it->second.position.size);
      const double pnl = reduceLocked(it->second, units, price);
      closed.push_back(closedTradeFrom(it->second, units, price, pnl));
      remaining -= units;
      if (it->second.position.size <= 0.0) {
        positions_.erase(it);
      }
    }

    if (remaining > 0.0) {
      const double notional = remaining * price;
      if (notional > balance_.free_margin) {
        result.error = "insufficient margin";
        // A partial reduction above already happened; report what filled.
        if (remaining == request.size) {
          return result;
        }
      } else {
        balance_.free_margin -= notional;
        auto& open = positions_[request.asset_pair];
        if (open.position.size <= 0.0) {
          open.position = domain::Position{};
          open.position.id = position_ids_.next();
          open.position.asset_pair = request.asset_pair;
          open.position.side = side;
          open.position.entry_price = price;
          open.position.opened_at_ms = time_provider_.now_ms();
          open.decision_id = request.decision_id;
          open.trade_id = trade_ids_.next();
        } else {
          // Same side: average in.
          const double total = open.position.size + remaining;
          open.position.entry_price =
              (open.position.entry_price * open.position.size +
               price * remaining) / total;
        }
        open.position.size += remaining;
        open.position.current_price = price;
        remaining = 0.0;
      }
    }

    result.success = true;
    result.filled_size = request.size - remaining;
    result.fill_price = price;
    auto open_it = positions_.find(request.asset_pair);
    result.trade_id = open_it != positions_.end() ? open_it->second.trade_id
                                                  : trade_ids_.next();
  }

  std::cout << "[MockTradingVenue] filled " << domain::toString(request.action)
            << " " << result.filled_size << " " << request.asset_pair << " @ "
            << price << " trade=" << result.trade_id << "\n";
  notifyClosed(closed);
  return result;
}

domain::OrderResult MockTradingVenue::closePosition(
    const domain::Position& position) {
  domain::OrderResult result;
  std::vector<domain::ClosedTrade> closed;
  {
    std::lock_guard lock(mutex_);
    auto it = positions_.find(position.asset_pair);
    if (it == positions_.end() || it->second.position.id != position.id) {
      result.error = "unknown position " + position.id;
      return result;
    }

    const double price = it->second.position.markPrice();
    const double units = it->second.position.size;
    const double pnl = reduceLocked(it->second, units, price);
    closed.push_back(closedTradeFrom(it->second, units, price, pnl));

    result.success = true;
    result.trade_id = it->second.trade_id;
    result.filled_size = units;
    result.fill_price = price;
    positions_.erase(it);
  }

  std::cout << "[MockTradingVenue] closed " << position.id << " ("
            << position.asset_pair << ")\n";
  notifyClosed(closed);
  return result;
}

// -----------------------------------------------------------------------------
// updateMark(): new mark price, unrealized P&L, return history
// -----------------------------------------------------------------------------
void MockTradingVenue::updateMark(const std::string& asset_pair,
                                  double price) {
  if (price <= 0.0) {
    return;
  }
  std::lock_guard lock(mutex_);

  auto mark = marks_.find(asset_pair);
  if (mark != marks_.end() && mark->second > 0.0) {
    auto& history = returns_[asset_pair];
    history.push_back(price / mark->second - 1.0);
    if (history.size() > max_return_history_) {
      history.erase(history.begin());
    }
  }
  marks_[asset_pair] = price;

  auto it = positions_.find(asset_pair);
  if (it != positions_.end()) {
    auto& p = it->second.position;
    p.current_price = price;
    const double move = (price - p.entry_price) * p.size;
    p.unrealized_pnl = p.side == domain::Side::Long ? move : -move;
  }
}

void MockTradingVenue::setCloseListener(CloseListener listener) {
  std::lock_guard lock(mutex_);
  close_listener_ = std::move(listener);
}

double MockTradingVenue::reduceLocked(OpenPosition& open, double units,
                                      double price) {
  auto& p = open.position;
  const double move = (price - p.entry_price) * units;
  const double pnl = p.side == domain::Side::Long ? move : -move;

  balance_.equity += pnl;
  balance_.free_margin += units * p.entry_price + pnl;

  p.size -= units;
  if (p.size > 0.0) {
    const double remaining_move = (price - p.entry_price) * p.size;
    p.unrealized_pnl =
        p.side == domain::Side::Long ? remaining_move : -remaining_move;
  } else {
    p.size = 0.0;
    p.unrealized_pnl = 0.0;
  }
  return pnl;
}

domain::ClosedTrade MockTradingVenue::closedTradeFrom(const OpenPosition& open,
                                                      double units,
                                                      double exit_price,
                                                      double pnl) const {
  domain::ClosedTrade t;
  t.trade_id = open.trade_id;
  t.decision_id = open.decision_id;
  t.asset_pair = open.position.asset_pair;
  t.side = open.position.side;
  t.size = units;
  t.entry_price = open.position.entry_price;
  t.exit_price = exit_price;
  t.realized_pnl = pnl;
  t.opened_at_ms = open.position.opened_at_ms;
  t.closed_at_ms = time_provider_.now_ms();
  return t;
}

void MockTradingVenue::notifyClosed(
    const std::vector<domain::ClosedTrade>& closed) {
  CloseListener listener;
  {
    std::lock_guard lock(mutex_);
    listener = close_listener_;
  }
  if (!listener) {
    return;
  }
  for (const auto& t : closed) {
    listener(t);
  }
}

}  // namespace tradeloop
