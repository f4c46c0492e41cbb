#include "tradeloop/risk/risk_gatekeeper.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace tradeloop {

RiskGatekeeper::RiskGatekeeper(const domain::RiskLimits& limits,
                               RejectionCache& cache,
                               const ExposureLedger& ledger,
                               const ITimeProvider& time_provider)
    : limits_(limits),
      cache_(cache),
      ledger_(ledger),
      time_provider_(time_provider),
      correlation_(static_cast<std::size_t>(
          std::max(limits.min_correlation_samples, 2))),
      var_(limits.var_confidence,
           static_cast<std::size_t>(std::max(limits.min_var_samples, 1))) {}

const std::vector<double>* RiskGatekeeper::returnsFor(
    const std::string& asset_pair, const domain::PortfolioSnapshot& portfolio,
    const domain::MarketSnapshot& snapshot) {
  if (asset_pair == snapshot.asset_pair && !snapshot.recent_returns.empty()) {
    return &snapshot.recent_returns;
  }
  auto it = portfolio.returns_by_asset.find(asset_pair);
  if (it == portfolio.returns_by_asset.end() || it->second.empty()) {
    return nullptr;
  }
  return &it->second;
}

// -----------------------------------------------------------------------------
// evaluate(): the six checks, in order
// -----------------------------------------------------------------------------
Verdict RiskGatekeeper::evaluate(const domain::Decision& decision,
                                 const domain::PortfolioSnapshot& portfolio,
                                 const domain::MarketSnapshot& snapshot,
                                 double position_size) {
  const std::int64_t now = time_provider_.now_ms();
  std::map<std::string, double> telemetry;

  // --- 1) Cooldown -----------------------------------------------------------
  if (auto record = cache_.active(decision.asset_pair, decision.action, now)) {
    telemetry["cooldown_remaining_ms"] =
        static_cast<double>(record->expires_at_ms - now);
    std::ostringstream detail;
    detail << "rejected for " << domain::toString(record->reason)
           << " until " << record->expires_at_ms;
    return reject(decision, domain::RejectionReason::CooldownActive,
                  detail.str(), std::move(telemetry), now, false);
  }

  // --- 2) Data freshness -----------------------------------------------------
  const std::int64_t age = now - snapshot.collected_at_ms;
  telemetry["data_age_ms"] = static_cast<double>(age);
  if (age > limits_.max_data_age_ms) {
    std::ostringstream detail;
    detail << "snapshot age " << age << " ms exceeds "
           << limits_.max_data_age_ms << " ms";
    return reject(decision, domain::RejectionReason::StaleData, detail.str(),
                  std::move(telemetry), now, true);
  }

  if (decision.action == domain::Action::Hold) {
    Verdict v;
    v.status = Verdict::Status::Approved;
    v.telemetry = std::move(telemetry);
    return v;
  }

  const double price = snapshot.price;
  const double direction = decision.action == domain::Action::Buy ? 1.0 : -1.0;

  // Net signed size already open on this pair. A trade against it first
  // reduces it; only the remainder is new exposure.
  double net_same_pair = 0.0;
  for (const auto& p : portfolio.positions) {
    if (p.asset_pair == decision.asset_pair) {
      net_same_pair += p.side == domain::Side::Long ? p.size : -p.size;
    }
  }
  double opening_size = position_size;
  if (net_same_pair * direction < 0.0) {
    opening_size = std::max(0.0, position_size - std::fabs(net_same_pair));
  }
  telemetry["opening_size"] = opening_size;

  // --- 3) Correlation exposure -----------------------------------------------
  if (opening_size > 0.0) {
    const auto* candidate_returns =
        returnsFor(decision.asset_pair, portfolio, snapshot);

    std::set<std::string> others;
    for (const auto& p : portfolio.positions) {
      if (p.asset_pair != decision.asset_pair) {
        others.insert(p.asset_pair);
      }
    }

    // An asset whose correlation cannot be measured counts as correlated.
    int correlated = 0;
    int undetermined = 0;
    for (const auto& asset : others) {
      const auto* other_returns = returnsFor(asset, portfolio, snapshot);
      std::optional<double> r;
      if (candidate_returns != nullptr && other_returns != nullptr) {
        r = correlation_.correlation(*candidate_returns, *other_returns);
      }
      if (!r.has_value()) {
        ++undetermined;
        continue;
      }
      if (std::fabs(*r) > limits_.correlation_threshold) {
        ++correlated;
        telemetry["correlation_" + asset] = *r;
      }
    }
    telemetry["correlated_count"] = correlated + undetermined;
    if (undetermined > 0) {
      telemetry["correlation_undetermined"] = undetermined;
    }

    if (correlated + undetermined + 1 > limits_.max_correlated_assets) {
      std::ostringstream detail;
      detail << correlated << " correlated open position(s)";
      if (undetermined > 0) {
        detail << " and " << undetermined << " without usable history";
      }
      detail << ", limit " << limits_.max_correlated_assets << " assets";
      return reject(decision, domain::RejectionReason::CorrelationLimit,
                    detail.str(), std::move(telemetry), now, true);
    }
  }

  // --- 4) Value-at-Risk ------------------------------------------------------
  const double equity = portfolio.balance ? portfolio.balance->equity : 0.0;
  telemetry["equity"] = equity;
  if (equity <= 0.0) {
    return reject(decision, domain::RejectionReason::VarLimit,
                  "no positive equity to measure VaR against",
                  std::move(telemetry), now, true);
  }

  std::map<std::string, double> notional_by_asset;
  for (const auto& p : portfolio.positions) {
    notional_by_asset[p.asset_pair] += p.signedNotional();
  }
  notional_by_asset[decision.asset_pair] += direction * position_size * price;

  std::vector<VarExposure> exposures;
  bool history_missing = false;
  for (const auto& [asset, notional] : notional_by_asset) {
    if (notional == 0.0) {
      continue;
    }
    const auto* returns = returnsFor(asset, portfolio, snapshot);
    if (returns == nullptr) {
      history_missing = true;
      break;
    }
    exposures.push_back(VarExposure{asset, notional, *returns});
  }

  VarResult var;
  if (!history_missing) {
    var = var_.compute(exposures);
  }
  if (var.computed) {
    telemetry["var_samples"] = static_cast<double>(var.samples);
  } else {
    // Stress proxy: every exposure loses var_fallback_loss_pct of its
    // notional at once.
    double gross = 0.0;
    for (const auto& entry : notional_by_asset) {
      gross += std::fabs(entry.second);
    }
    var.var_amount = gross * limits_.var_fallback_loss_pct;
    telemetry["var_fallback"] = 1.0;
    std::cout << "[RiskGatekeeper] VaR for " << decision.asset_pair
              << " uses stress proxy: insufficient return history\n";
  }

  const double var_pct = var.var_amount / equity;
  telemetry["var_amount"] = var.var_amount;
  telemetry["var_pct"] = var_pct;
  if (var_pct > limits_.max_var_pct) {
    std::ostringstream detail;
    detail << (var.computed ? "portfolio VaR " : "stress-proxy VaR ")
           << var_pct * 100.0 << "% of equity exceeds "
           << limits_.max_var_pct * 100.0 << "%";
    return reject(decision, domain::RejectionReason::VarLimit, detail.str(),
                  std::move(telemetry), now, true);
  }

  // --- 5) Margin headroom ----------------------------------------------------
  const double leverage = limits_.max_leverage > 0.0 ? limits_.max_leverage : 1.0;
  const double required = opening_size * price / leverage;
  const double free_margin = portfolio.balance->free_margin;
  const double available = free_margin -
                           limits_.margin_safety_buffer_pct * equity -
                           ledger_.heldMargin();
  telemetry["required_margin"] = required;
  telemetry["available_margin"] = available;

  if (required > available) {
    std::ostringstream detail;
    detail << "required margin " << required << " exceeds available "
           << available;
    return reject(decision, domain::RejectionReason::MarginLimit, detail.str(),
                  std::move(telemetry), now, true);
  }

  // --- 6) Volatility / confidence --------------------------------------------
  telemetry["volatility"] = snapshot.volatility;
  if (snapshot.volatility > limits_.max_volatility &&
      decision.confidence < limits_.min_confidence_in_volatility) {
    std::ostringstream detail;
    detail << "volatility " << snapshot.volatility << " above "
           << limits_.max_volatility << " needs confidence >= "
           << limits_.min_confidence_in_volatility << ", got "
           << decision.confidence;
    return reject(decision, domain::RejectionReason::VolatilityLimit,
                  detail.str(), std::move(telemetry), now, true);
  }

  Verdict v;
  v.status = Verdict::Status::Approved;
  v.telemetry = std::move(telemetry);
  std::cout << "[RiskGatekeeper] APPROVED " << decision.asset_pair << " "
            << domain::toString(decision.action) << " size=" << position_size
            << "\n";
  return v;
}

Verdict RiskGatekeeper::reject(const domain::Decision& decision,
                               domain::RejectionReason reason,
                               std::string detail,
                               std::map<std::string, double> telemetry,
                               std::int64_t now_ms, bool record_cooldown) {
  if (record_cooldown) {
    cache_.insert(decision.asset_pair, decision.action, reason, now_ms);
  }

  std::cout << "[RiskGatekeeper] REJECTED " << decision.asset_pair << " "
            << domain::toString(decision.action) << ": "
            << domain::toString(reason) << " (" << detail << ")\n";

  Verdict v;
  v.status = Verdict::Status::Rejected;
  v.reason = reason;
  v.detail = std::move(detail);
  v.telemetry = std::move(telemetry);
  return v;
}

}  // namespace tradeloop
