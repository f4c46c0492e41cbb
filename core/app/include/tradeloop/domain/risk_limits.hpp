#pragma once

#include <cstdint>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — thresholds applied by RiskGatekeeper
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct with value semantics, copied into the gatekeeper
//         at construction and constant for its lifetime.
//
// @details
// Loaded from the "risk" section of the agent configuration (see
// tradeloop/config/config_loader.hpp). Percentages are fractions here:
// 0.05 means 5%. The loader normalizes whole-number percentages.
//
// Checks that use each field:
//   freshness    → max_data_age_ms
//   correlation  → correlation_threshold, max_correlated_assets,
//                  min_correlation_samples
//   VaR          → max_var_pct, var_confidence, min_var_samples,
//                  var_fallback_loss_pct
//   margin       → margin_safety_buffer_pct, max_leverage
//   volatility   → max_volatility, min_confidence_in_volatility
//   cooldown     → cooldown_ms
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Snapshots older than this are stale (15 minutes).
  std::int64_t max_data_age_ms{15 * 60 * 1000};

  /// |Pearson correlation| strictly above this counts as correlated.
  double correlation_threshold{0.7};

  /// Maximum number of mutually correlated assets, candidate included.
  int max_correlated_assets{2};

  /// Minimum overlapping return samples before a correlation is trusted.
  int min_correlation_samples{10};

  /// Portfolio VaR as a fraction of equity.
  double max_var_pct{0.05};

  double var_confidence{0.95};

  /// Fewer joint samples than this switches VaR to the stress proxy.
  int min_var_samples{30};

  /// Stress proxy used when historical VaR cannot be computed: every
  /// exposure is assumed to lose this fraction of its notional, with no
  /// diversification.
  double var_fallback_loss_pct{0.10};

  /// Fraction of equity kept free on top of required margin.
  double margin_safety_buffer_pct{0.10};

  double max_leverage{1.0};

  /// Above this snapshot volatility a decision needs at least
  /// min_confidence_in_volatility to trade.
  double max_volatility{0.05};
  double min_confidence_in_volatility{0.80};

  /// Lifetime of a RejectionRecord.
  std::int64_t cooldown_ms{15 * 60 * 1000};
};

}  // namespace domain
}  // namespace tradeloop
