#pragma once

#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/market_snapshot.hpp"
#include "tradeloop/domain/portfolio.hpp"
#include "tradeloop/domain/rejection_record.hpp"
#include "tradeloop/domain/risk_limits.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/risk/correlation_analyzer.hpp"
#include "tradeloop/risk/rejection_cache.hpp"
#include "tradeloop/risk/var_calculator.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Verdict — result of RiskGatekeeper::evaluate()
// -----------------------------------------------------------------------------
//
// reason is set iff status == Rejected. telemetry carries the numbers the
// checks were computed from (data_age_ms, correlated_count, var_pct,
// required_margin, available_margin, ...) for the risk_rejected event and
// for logs. A VaR computed from the stress proxy sets "var_fallback".
// -----------------------------------------------------------------------------
struct Verdict {
  enum class Status : std::uint8_t { Approved, Rejected };

  Status status{Status::Rejected};
  std::optional<domain::RejectionReason> reason;
  std::string detail;
  std::map<std::string, double> telemetry;

  bool approved() const { return status == Status::Approved; }
};

// -----------------------------------------------------------------------------
// RiskGatekeeper — pre-trade checks between Reasoning and Execution
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a Decision may reach the venue. Nothing is
//         executed without an Approved verdict from evaluate().
//
// @details
// Checks run in this order; the first failure rejects and the remaining
// checks do not run:
//
//   1. Cooldown      (asset pair, action) has an unexpired RejectionRecord
//                    → cooldown_active. The existing record is not extended.
//   2. Freshness     now - snapshot.collected_at_ms > max_data_age_ms
//                    → stale_data.
//   3. Correlation   open positions on other assets whose |Pearson r| with
//                    the candidate exceeds correlation_threshold are counted;
//                    an asset whose correlation cannot be measured (missing
//                    or too little history on either side) counts too;
//                    count + 1 > max_correlated_assets → correlation_limit.
//                    A decision that only reduces an existing opposite
//                    position on the same pair opens no new exposure and is
//                    exempt.
//   4. VaR           historical VaR of all exposures after the trade, as a
//                    fraction of equity, > max_var_pct → var_limit. With too
//                    little joint history the VaR is the stress proxy
//                    gross notional * var_fallback_loss_pct instead.
//                    Non-positive equity rejects.
//   5. Margin        opening notional / max_leverage must fit in
//                    free_margin - margin_safety_buffer_pct * equity
//                    - margin held by in-flight reservations
//                    → margin_limit otherwise.
//   6. Volatility    snapshot volatility > max_volatility with decision
//                    confidence < min_confidence_in_volatility
//                    → volatility_limit.
//
// Every rejection except cooldown_active inserts a RejectionRecord for
// (asset pair, action) and logs the reason. Approval leaves the cache
// untouched.
//
// A Hold decision opens no exposure: only checks 1 and 2 apply to it.
//
// Thread model:
//   evaluate() is called from the agent loop thread. The cache and the
//   ledger are internally synchronized; the gatekeeper itself holds no
//   mutable state.
//
// Ownership:
//   Borrows the cache, the ledger and the clock; all must outlive it.
// -----------------------------------------------------------------------------
class RiskGatekeeper {
 public:
  RiskGatekeeper(const domain::RiskLimits& limits, RejectionCache& cache,
                 const ExposureLedger& ledger,
                 const ITimeProvider& time_provider);

  RiskGatekeeper(const RiskGatekeeper&) = delete;
  RiskGatekeeper& operator=(const RiskGatekeeper&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(decision, portfolio, snapshot, position_size)
  // -------------------------------------------------------------------------
  // @param  decision       Proposal from Reasoning.
  // @param  portfolio      Positions, balance and per-asset returns.
  // @param  snapshot       The snapshot the decision was made from. Its
  //                        price values the candidate; its recent_returns
  //                        are the candidate's return history.
  // @param  position_size  Units the ExecutionStage would order.
  //
  // @return Verdict. Never throws for market conditions.
  //
  // Side-effects: May insert into the RejectionCache; logs rejections.
  // -------------------------------------------------------------------------
  Verdict evaluate(const domain::Decision& decision,
                   const domain::PortfolioSnapshot& portfolio,
                   const domain::MarketSnapshot& snapshot,
                   double position_size);

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  Verdict reject(const domain::Decision& decision,
                 domain::RejectionReason reason, std::string detail,
                 std::map<std::string, double> telemetry,
                 std::int64_t now_ms, bool record_cooldown);

  // Return history for an asset: the snapshot's own series for the
  // candidate pair, otherwise the portfolio's.
  static const std::vector<double>* returnsFor(
      const std::string& asset_pair,
      const domain::PortfolioSnapshot& portfolio,
      const domain::MarketSnapshot& snapshot);

  const domain::RiskLimits limits_;
  RejectionCache& cache_;
  const ExposureLedger& ledger_;
  const ITimeProvider& time_provider_;
  CorrelationAnalyzer correlation_;
  VarCalculator var_;
};

}  // namespace tradeloop
