#include "tradeloop/recovery/recovery_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <tuple>
#include <utility>

namespace tradeloop {

RecoveryManager::RecoveryManager(ITradingVenue& venue, ITradeMonitor& monitor,
                                 IPortfolioMemory& memory,
                                 ExposureLedger& ledger,
                                 const ITimeProvider& time_provider,
                                 RecoverySettings settings)
    : venue_(venue),
      monitor_(monitor),
      memory_(memory),
      ledger_(ledger),
      time_provider_(time_provider),
      settings_(std::move(settings)) {}

bool RecoveryManager::closesBefore(const domain::Position& a,
                                   const domain::Position& b) {
  const bool a_nan = std::isnan(a.unrealized_pnl);
  const bool b_nan = std::isnan(b.unrealized_pnl);
  if (a_nan != b_nan) {
    return a_nan;
  }
  if (!a_nan && a.unrealized_pnl != b.unrealized_pnl) {
    return a.unrealized_pnl < b.unrealized_pnl;
  }
  return std::tie(a.opened_at_ms, a.asset_pair, a.id) <
         std::tie(b.opened_at_ms, b.asset_pair, b.id);
}

std::vector<std::size_t> RecoveryManager::selectIndicesToClose(
    const std::vector<domain::Position>& positions,
    std::size_t max_concurrent) {
  if (positions.size() <= max_concurrent) {
    return {};
  }
  std::vector<std::size_t> order(positions.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(),
            [&positions](std::size_t a, std::size_t b) {
              if (closesBefore(positions[a], positions[b])) return true;
              if (closesBefore(positions[b], positions[a])) return false;
              return a < b;
            });
  order.resize(positions.size() - max_concurrent);
  return order;
}

std::vector<domain::Position> RecoveryManager::selectPositionsToClose(
    std::vector<domain::Position> positions, std::size_t max_concurrent) {
  std::vector<domain::Position> selected;
  for (std::size_t i : selectIndicesToClose(positions, max_concurrent)) {
    selected.push_back(positions[i]);
  }
  return selected;
}

std::string RecoveryManager::syntheticDecisionId(const std::string& asset_pair,
                                                 std::int64_t now_ms,
                                                 std::size_t n) {
  return "RECOVERED_" + asset_pair + "_" + std::to_string(now_ms) + "_" +
         std::to_string(n);
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
RecoveryReport RecoveryManager::run() {
  RecoveryReport report;
  const std::int64_t started = time_provider_.now_ms();

  std::cout << "[RecoveryManager] starting (max_concurrent_trades="
            << settings_.max_concurrent_trades << ")\n";

  // --- 1) In-flight reservations from an interrupted run ---------------------
  report.released_reservations = ledger_.releaseAll("recovery", started);

  // --- 2) Fetch positions, one retry ----------------------------------------
  domain::RetryPolicy fetch_policy;
  fetch_policy.max_attempts = 2;
  fetch_policy.timeout = settings_.fetch_timeout;
  fetch_policy.backoff = {settings_.fetch_backoff};

  ITradingVenue& venue = venue_;
  auto fetched =
      caller_.call(fetch_policy, [&venue] { return venue.getPositions(); });
  report.fetch_attempts = fetched.attempts;

  std::vector<domain::Position> positions;
  if (fetched.ok()) {
    positions = std::move(*fetched.value);
  } else {
    report.degraded = true;
    std::cerr << "[RecoveryManager] WARNING: position fetch failed after "
              << fetched.attempts << " attempts (" << fetched.error
              << "); continuing with no positions\n";
  }
  report.positions_found = positions.size();

  // --- 3) Enforce max_concurrent_trades ------------------------------------
  const auto to_close =
      selectIndicesToClose(positions, settings_.max_concurrent_trades);
  std::vector<bool> closed(positions.size(), false);

  for (std::size_t index : to_close) {
    const domain::Position& position = positions[index];
    std::cout << "[RecoveryManager] closing excess position " << position.id
              << " " << position.asset_pair
              << " unrealized_pnl=" << position.unrealized_pnl << "\n";

    auto result = caller_.call(
        domain::RetryPolicy::once(settings_.close_timeout),
        [&venue, position] { return venue.closePosition(position); });

    if (result.ok() && result.value->success) {
      ++report.actions_taken;
      report.closed.push_back(position);
      closed[index] = true;
      continue;
    }

    std::string error = result.ok() ? result.value->error : result.error;
    std::cerr << "[RecoveryManager] ERROR: failed to close " << position.id
              << ": " << error << "\n";
    report.safe = false;
    if (!report.error.empty()) {
      report.error += "; ";
    }
    report.error += "close " + position.id + " failed: " + error;
  }

  // --- 4) Adopt survivors ----------------------------------------------------
  std::size_t n = 0;
  for (std::size_t i = 0; i < positions.size(); ++i) {
    if (closed[i]) {
      continue;
    }
    domain::Position position = positions[i];
    std::string decision_id =
        syntheticDecisionId(position.asset_pair, started, n++);
    try {
      monitor_.associateDecisionToTrade(decision_id, position.asset_pair,
                                        position.id);
      report.adopted_decision_ids.push_back(decision_id);
    } catch (const std::exception& e) {
      std::cerr << "[RecoveryManager] WARNING: could not associate "
                << position.id << " with trade monitor: " << e.what() << "\n";
    }

    if (position.entry_price <= 0.0) {
      position.entry_price = position.current_price;
    }
    try {
      memory_.recordRecoveredPosition(decision_id, position);
    } catch (const std::exception& e) {
      std::cerr << "[RecoveryManager] WARNING: could not record "
                << position.id << " in portfolio memory: " << e.what()
                << "\n";
    }
  }

  std::cout << "[RecoveryManager] " << (report.safe ? "complete" : "FAILED")
            << ": found=" << report.positions_found
            << " closed=" << report.actions_taken
            << (report.degraded ? " (degraded)" : "") << "\n";
  return report;
}

}  // namespace tradeloop
