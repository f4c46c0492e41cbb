#pragma once

#include "tradeloop/concurrent/bounded_caller.hpp"
#include "tradeloop/domain/position.hpp"
#include "tradeloop/domain/retry_policy.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/ports/i_portfolio_memory.hpp"
#include "tradeloop/ports/i_trade_monitor.hpp"
#include "tradeloop/ports/i_trading_venue.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tradeloop {

struct RecoverySettings {
  bool enabled{true};
  std::size_t max_concurrent_trades{2};
  std::chrono::milliseconds fetch_timeout{10000};
  std::chrono::milliseconds fetch_backoff{1000};
  std::chrono::milliseconds close_timeout{10000};
};

// -----------------------------------------------------------------------------
// RecoveryReport — outcome of one startup recovery
// -----------------------------------------------------------------------------
//
// safe == false only when a required close failed; the agent then emits
// recovery_failed and halts. degraded == true means positions could not be
// fetched even after the retry and recovery proceeded with none.
// -----------------------------------------------------------------------------
struct RecoveryReport {
  bool safe{true};
  bool degraded{false};
  int fetch_attempts{0};
  std::size_t positions_found{0};
  std::size_t actions_taken{0};
  std::vector<domain::Position> closed;
  std::vector<std::string> adopted_decision_ids;
  std::vector<std::string> released_reservations;
  std::string error;
};

// -----------------------------------------------------------------------------
// RecoveryManager — startup reconciliation against the live venue
// -----------------------------------------------------------------------------
//
// @brief  Brings in-memory state in line with the venue before the first
//         Perception stage, and enforces max_concurrent_trades on whatever
//         is already open.
//
// @details
// run():
//   1. Releases every Held reservation left in the ledger. Nothing is in
//      flight at startup, so any Held entry is from an interrupted run.
//   2. Fetches open positions. The fetch is retried exactly once
//      (fetch_backoff between attempts, fetch_timeout per attempt). If both
//      attempts fail, recovery continues with an empty position list and
//      reports degraded.
//   3. If more than max_concurrent_trades positions are open, closes the
//      excess (positions - max) chosen by selectPositionsToClose(). Each
//      close is one venue call, never retried.
//   4. Associates every surviving position with the trade monitor under a
//      synthetic decision id RECOVERED_<pair>_<now_ms>_<n> and records it in
//      portfolio memory under the same id. A position reported without an
//      entry price is recorded at its current price. Failure of either
//      collaborator is logged and does not make recovery unsafe.
//
// Tie-break rule for closing (closesBefore):
//   a NaN unrealized P&L first (unknown is treated as worst); then worst
//   unrealized P&L; then oldest opened_at_ms; then asset pair; then position
//   id (both lexicographic). Positions equal on all of these keep venue
//   order. Survivors are tracked by index, so duplicate or empty ids from
//   the venue cannot hide a position.
//
// Thread model:
//   run() is called once, from the agent loop thread, before trading
//   starts.
// -----------------------------------------------------------------------------
class RecoveryManager {
 public:
  RecoveryManager(ITradingVenue& venue, ITradeMonitor& monitor,
                  IPortfolioMemory& memory, ExposureLedger& ledger,
                  const ITimeProvider& time_provider,
                  RecoverySettings settings);

  RecoveryManager(const RecoveryManager&) = delete;
  RecoveryManager& operator=(const RecoveryManager&) = delete;

  RecoveryReport run();

  // -------------------------------------------------------------------------
  // selectPositionsToClose(positions, max_concurrent)
  // -------------------------------------------------------------------------
  // @return The first (positions.size() - max_concurrent) positions in
  //         closesBefore() order; empty when within the limit.
  // -------------------------------------------------------------------------
  static std::vector<domain::Position> selectPositionsToClose(
      std::vector<domain::Position> positions, std::size_t max_concurrent);

  // Same selection, as indices into positions.
  static std::vector<std::size_t> selectIndicesToClose(
      const std::vector<domain::Position>& positions,
      std::size_t max_concurrent);

  static bool closesBefore(const domain::Position& a,
                           const domain::Position& b);

  // RECOVERED_<pair>_<ms>_<n>
  static std::string syntheticDecisionId(const std::string& asset_pair,
                                         std::int64_t now_ms, std::size_t n);

  const RecoverySettings& settings() const { return settings_; }

 private:
  ITradingVenue& venue_;
  ITradeMonitor& monitor_;
  IPortfolioMemory& memory_;
  ExposureLedger& ledger_;
  const ITimeProvider& time_provider_;
  const RecoverySettings settings_;
  BoundedCaller caller_{"RecoveryManager"};
};

}  // namespace tradeloop
