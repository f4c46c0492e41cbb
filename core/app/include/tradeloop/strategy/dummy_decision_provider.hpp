#pragma once

#include "tradeloop/ports/i_decision_provider.hpp"

namespace tradeloop {

// Tuning for DummyDecisionProvider.
struct TrendSettings {
  double trend_threshold{0.001};  // |trend| below this → HOLD
  double overbought_rsi{70.0};    // no BUY above
  double oversold_rsi{30.0};      // no SELL below
  double stop_volatility_multiple{2.0};
};

// -----------------------------------------------------------------------------
// DummyDecisionProvider
// -----------------------------------------------------------------------------
// What: Trend follower used when no reasoning service is attached. BUY when
// the snapshot's trend is above the threshold, SELL when below its negative,
// HOLD otherwise or when RSI says the move is exhausted. Confidence grows
// with |trend| (0.5 at the threshold, 1.0 at twice the threshold). The
// stop-loss is a multiple of the snapshot's volatility when it has one.
//
// Why: Lets the paper executable run full cycles, and gives integration
// tests a deterministic provider.
//
// Thread-safety: Stateless; proposeDecision() may run on any thread.
// -----------------------------------------------------------------------------
class DummyDecisionProvider final : public IDecisionProvider {
 public:
  explicit DummyDecisionProvider(TrendSettings settings = TrendSettings{})
      : settings_(settings) {}

  std::optional<domain::Decision> proposeDecision(
      const domain::MarketSnapshot& snapshot,
      const std::optional<domain::PortfolioSnapshot>& portfolio) override;

 private:
  static constexpr const char* kProviderId = "DummyDecisionProvider";

  TrendSettings settings_;
};

}  // namespace tradeloop
