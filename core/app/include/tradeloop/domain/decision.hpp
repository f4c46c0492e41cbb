#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {
namespace domain {

enum class Action : std::uint8_t { Buy, Sell, Hold };

inline const char* toString(Action a) {
  switch (a) {
    case Action::Buy:  return "BUY";
    case Action::Sell: return "SELL";
    case Action::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Decision — a proposed trading action produced during Reasoning
// -----------------------------------------------------------------------------
//
// @brief  Output of the decision provider for one asset pair and one cycle.
//
// @details
// Produced by IDecisionProvider, completed by the agent (id, signal_only)
// and never modified after the Reasoning stage. Everything downstream
// (RiskGatekeeper, ExecutionStage, Learning) reads it by const reference.
//
//   - confidence:                 in [0, 1]. Values outside are rejected by
//                                 the agent as an invalid decision.
//   - recommended_position_size:  units of the base asset. When absent the
//                                 PositionSizer derives a size from equity.
//   - stop_loss_fraction:         e.g. 0.02 for a 2% stop. Feeds risk-based
//                                 sizing only.
//   - signal_only:                set when balance / portfolio data was not
//                                 available. Such a decision is recorded but
//                                 never executed.
//
// Ownership:
//   Value type. Copied into events and cycle outcomes.
// -----------------------------------------------------------------------------
struct Decision {
  std::string id;
  std::string asset_pair;
  Action action{Action::Hold};
  double confidence{0.0};
  std::optional<double> recommended_position_size;
  std::optional<double> stop_loss_fraction;
  double entry_price{0.0};
  std::vector<std::string> providers;
  std::string reasoning;
  std::int64_t created_at_ms{0};
  bool signal_only{false};
};

}  // namespace domain
}  // namespace tradeloop
