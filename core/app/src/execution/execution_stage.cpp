#include "tradeloop/execution/execution_stage.hpp"
#include "tradeloop/domain/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace tradeloop {

namespace {

// -----------------------------------------------------------------------------
// ReservationGuard
// -----------------------------------------------------------------------------
// Releases a Held reservation on scope exit unless the outcome has been
// settled explicitly. Only fires on exceptional paths; the normal paths call
// commit() / release() themselves and then settle().
// -----------------------------------------------------------------------------
class ReservationGuard {
 public:
  ReservationGuard(ExposureLedger& ledger, const ITimeProvider& clock,
                   std::string reservation_id)
      : ledger_(ledger), clock_(clock), id_(std::move(reservation_id)) {}

  ~ReservationGuard() {
    if (!settled_) {
      std::cerr << "[ExecutionStage] rolling back " << id_
                << " after unexpected error\n";
      ledger_.release(id_, "execution_aborted", clock_.now_ms());
    }
  }

  ReservationGuard(const ReservationGuard&) = delete;
  ReservationGuard& operator=(const ReservationGuard&) = delete;

  void settle() { settled_ = true; }

 private:
  ExposureLedger& ledger_;
  const ITimeProvider& clock_;
  std::string id_;
  bool settled_{false};
};

}  // namespace

ExecutionStage::ExecutionStage(ExposureLedger& ledger, ITradingVenue& venue,
                               ITradeMonitor& monitor,
                               const ITimeProvider& time_provider,
                               ExecutionSettings settings)
    : ledger_(ledger),
      venue_(venue),
      monitor_(monitor),
      time_provider_(time_provider),
      settings_(std::move(settings)) {}

// -----------------------------------------------------------------------------
// execute()
// -----------------------------------------------------------------------------
ExecutionResult ExecutionStage::execute(const domain::Decision& decision,
                                        double size, double reference_price) {
  if (decision.action == domain::Action::Hold) {
    throw InvariantViolation("HOLD decision " + decision.id +
                             " reached execution");
  }
  if (size <= 0.0) {
    throw InvariantViolation("non-positive order size for decision " +
                             decision.id);
  }

  if (hasOrderInDoubt(decision.asset_pair)) {
    ExecutionResult refused;
    refused.error = "earlier order on " + decision.asset_pair +
                    " is still unresolved";
    std::cerr << "[ExecutionStage] REFUSED " << decision.id << ": "
              << *refused.error << "\n";
    return refused;
  }

  const double notional = size * reference_price;
  const double leverage =
      settings_.max_leverage > 0.0 ? settings_.max_leverage : 1.0;

  // --- a) Reserve ------------------------------------------------------------
  ExecutionResult result;
  result.reservation_id =
      ledger_.reserve(decision.id, decision.asset_pair, notional,
                      notional / leverage, time_provider_.now_ms());
  ReservationGuard guard(ledger_, time_provider_, result.reservation_id);

  // --- b) Submit -------------------------------------------------------------
  domain::OrderRequest request;
  request.decision_id = decision.id;
  request.reservation_id = result.reservation_id;
  request.asset_pair = decision.asset_pair;
  request.action = decision.action;
  request.size = size;
  request.reference_price = reference_price;
  request.stop_loss_fraction = decision.stop_loss_fraction;

  std::cout << "[ExecutionStage] submitting " << domain::toString(request.action)
            << " " << request.size << " " << request.asset_pair << " @ "
            << request.reference_price << " (" << result.reservation_id
            << ")\n";

  ITradingVenue& venue = venue_;
  auto outcome =
      caller_.call(domain::RetryPolicy::once(settings_.order_timeout),
                   [&venue, request] { return venue.submitOrder(request); });

  // --- c) Commit -------------------------------------------------------------
  if (outcome.ok() && outcome.value->success) {
    ledger_.commit(result.reservation_id, time_provider_.now_ms());
    guard.settle();

    result.status = ExecutionResult::Status::Filled;
    result.trade_id = outcome.value->trade_id;
    result.filled_size =
        outcome.value->filled_size > 0.0 ? outcome.value->filled_size : size;
    result.fill_price = outcome.value->fill_price > 0.0
                            ? outcome.value->fill_price
                            : reference_price;

    // The fill stands even if the monitor cannot record it.
    try {
      monitor_.associateDecisionToTrade(decision.id, decision.asset_pair,
                                        outcome.value->trade_id);
    } catch (const std::exception& e) {
      std::cerr << "[ExecutionStage] WARNING: trade monitor association "
                   "failed for "
                << outcome.value->trade_id << ": " << e.what() << "\n";
    }

    std::cout << "[ExecutionStage] FILLED " << decision.asset_pair
              << " trade=" << outcome.value->trade_id << "\n";
    return result;
  }

  // --- d) Roll back ----------------------------------------------------------
  std::string error;
  if (!outcome.ok()) {
    error = outcome.error;
    result.timed_out = outcome.timedOut();
    if (outcome.late.valid()) {
      in_doubt_.push_back(OrderInDoubt{request, outcome.late});
    }
  } else {
    error = outcome.value->error.empty() ? "order rejected by venue"
                                         : outcome.value->error;
  }

  ledger_.release(result.reservation_id,
                  result.timed_out ? "timeout" : "submission_failed",
                  time_provider_.now_ms());
  guard.settle();

  result.status = ExecutionResult::Status::Failed;
  result.error = error;
  std::cerr << "[ExecutionStage] FAILED " << decision.asset_pair << ": "
            << error << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// collectLateFills()
// -----------------------------------------------------------------------------
std::vector<LateFill> ExecutionStage::collectLateFills() {
  std::vector<LateFill> fills;

  auto resolved = [this, &fills](const OrderInDoubt& order) {
    if (order.result.wait_for(std::chrono::seconds(0)) !=
        std::future_status::ready) {
      return false;
    }
    const domain::OrderRequest& request = order.request;

    domain::OrderResult venue_result;
    try {
      venue_result = order.result.get();
    } catch (const std::exception& e) {
      std::cerr << "[ExecutionStage] order for " << request.decision_id
                << " resolved without fill: " << e.what() << "\n";
      return true;
    }
    if (!venue_result.success) {
      std::cerr << "[ExecutionStage] order for " << request.decision_id
                << " resolved without fill: " << venue_result.error << "\n";
      return true;
    }

    LateFill fill;
    fill.decision_id = request.decision_id;
    fill.asset_pair = request.asset_pair;
    fill.reservation_id = request.reservation_id;
    fill.trade_id = venue_result.trade_id;
    fill.action = request.action;
    fill.size = venue_result.filled_size > 0.0 ? venue_result.filled_size
                                               : request.size;
    fill.fill_price = venue_result.fill_price > 0.0
                          ? venue_result.fill_price
                          : request.reference_price;

    try {
      monitor_.associateDecisionToTrade(fill.decision_id, fill.asset_pair,
                                        fill.trade_id);
    } catch (const std::exception& e) {
      std::cerr << "[ExecutionStage] WARNING: trade monitor association "
                   "failed for "
                << fill.trade_id << ": " << e.what() << "\n";
    }

    std::cerr << "[ExecutionStage] LATE FILL " << fill.asset_pair
              << " trade=" << fill.trade_id << " after timeout ("
              << fill.reservation_id << ")\n";
    fills.push_back(std::move(fill));
    return true;
  };

  in_doubt_.erase(std::remove_if(in_doubt_.begin(), in_doubt_.end(), resolved),
                  in_doubt_.end());
  return fills;
}

bool ExecutionStage::hasOrderInDoubt(const std::string& asset_pair) const {
  return std::any_of(in_doubt_.begin(), in_doubt_.end(),
                     [&asset_pair](const OrderInDoubt& order) {
                       return order.request.asset_pair == asset_pair;
                     });
}

std::vector<std::string> ExecutionStage::sweepStale() {
  return ledger_.sweepStale(time_provider_.now_ms(),
                            settings_.max_reservation_age_ms);
}

}  // namespace tradeloop
