#pragma once

#include "tradeloop/concurrent/bounded_caller.hpp"
#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/order.hpp"
#include "tradeloop/domain/retry_policy.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/ports/i_trade_monitor.hpp"
#include "tradeloop/ports/i_trading_venue.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ExecutionResult — what happened to one approved decision
// -----------------------------------------------------------------------------
struct ExecutionResult {
  enum class Status : std::uint8_t { Filled, Failed };

  Status status{Status::Failed};
  std::string reservation_id;
  std::optional<std::string> trade_id;
  std::optional<std::string> error;
  double filled_size{0.0};
  double fill_price{0.0};
  bool timed_out{false};

  bool filled() const { return status == Status::Filled; }
};

// A submission that timed out and was filled by the venue afterwards.
struct LateFill {
  std::string decision_id;
  std::string asset_pair;
  std::string reservation_id;
  std::string trade_id;
  domain::Action action{domain::Action::Buy};
  double size{0.0};
  double fill_price{0.0};
};

struct ExecutionSettings {
  std::chrono::milliseconds order_timeout{10000};
  std::int64_t max_reservation_age_ms{5 * 60 * 1000};
  double max_leverage{1.0};
};

// -----------------------------------------------------------------------------
// ExecutionStage — reserve, submit, then commit or roll back
// -----------------------------------------------------------------------------
//
// @brief  Places one order for an approved Decision without ever leaving
//         capital reserved for an order that did not happen.
//
// @details
// execute() protocol:
//
//   a) ledger.reserve()          → Held. Throws InvariantViolation if the
//                                  pair already has a Held reservation.
//   b) venue.submitOrder()       → one attempt, bounded by order_timeout.
//                                  Orders are never retried.
//   c) success                   → ledger.commit(); the trade is associated
//                                  with the decision in the trade monitor.
//   d) rejected / threw / timed  → ledger.release() before returning Failed.
//      out
//
// A ReservationGuard releases the reservation if anything throws between
// (a) and (c)/(d), so no path leaves it Held.
//
// sweepStale() releases Held reservations older than
// max_reservation_age_ms. The agent calls it at the end of every execution
// batch and while Idle.
//
// Orders in doubt:
//   A submission that timed out may still complete on the venue. Its
//   reservation is Released and the result is Failed, but the request and
//   the pending venue result are kept. While one is unresolved for a pair,
//   execute() refuses that pair without reserving or submitting.
//   collectLateFills() resolves the finished ones: a late success is
//   associated with its decision in the trade monitor and handed back so
//   the caller can count and publish it; a late rejection is dropped.
//
// Thread model:
//   Called from the agent loop thread. The venue call runs on a
//   BoundedCaller worker.
//
// Ownership:
//   Borrows the ledger, venue, monitor and clock. Owns its BoundedCaller,
//   whose destructor waits for any timed-out submission.
// -----------------------------------------------------------------------------
class ExecutionStage {
 public:
  ExecutionStage(ExposureLedger& ledger, ITradingVenue& venue,
                 ITradeMonitor& monitor, const ITimeProvider& time_provider,
                 ExecutionSettings settings);

  ExecutionStage(const ExecutionStage&) = delete;
  ExecutionStage& operator=(const ExecutionStage&) = delete;

  // -------------------------------------------------------------------------
  // execute(decision, size, reference_price)
  // -------------------------------------------------------------------------
  // @param  decision         Approved Buy or Sell decision.
  // @param  size             Units to order (> 0).
  // @param  reference_price  Snapshot price; values the reservation.
  //
  // @return Filled with trade id, or Failed with error. The reservation is
  //         Committed or Released on return, never Held.
  //
  // @throws InvariantViolation for a Hold decision, a non-positive size, or
  //         a second Held reservation on the pair.
  //
  // Fails without a reservation while an earlier order on the pair is in
  // doubt. Call collectLateFills() first.
  // -------------------------------------------------------------------------
  ExecutionResult execute(const domain::Decision& decision, double size,
                          double reference_price);

  // Resolves timed-out submissions whose venue result has arrived.
  std::vector<LateFill> collectLateFills();

  bool hasOrderInDoubt(const std::string& asset_pair) const;
  std::size_t ordersInDoubt() const { return in_doubt_.size(); }

  // Releases reservations older than max_reservation_age_ms.
  std::vector<std::string> sweepStale();

  const ExecutionSettings& settings() const { return settings_; }

 private:
  ExposureLedger& ledger_;
  ITradingVenue& venue_;
  ITradeMonitor& monitor_;
  const ITimeProvider& time_provider_;
  const ExecutionSettings settings_;

  struct OrderInDoubt {
    domain::OrderRequest request;
    std::shared_future<domain::OrderResult> result;
  };
  std::vector<OrderInDoubt> in_doubt_;

  BoundedCaller caller_{"ExecutionStage"};
};

}  // namespace tradeloop
