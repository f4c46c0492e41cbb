#pragma once

#include "tradeloop/domain/agent_state.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tradeloop {
namespace domain {

// How a decision cycle ended.
enum class OutcomeKind : std::uint8_t {
  DataUnavailable,  // snapshot fetch failed
  StaleData,        // snapshot failed freshness check in Perception
  NoDecision,       // provider unavailable, empty or invalid
  Held,             // decision was HOLD
  SignalOnly,       // no balance data; recorded, not executed
  Skipped,          // policy gate (confidence, daily limit, approval, size)
  Rejected,         // RiskGatekeeper verdict
  Filled,           // order committed
  Failed            // order submission failed, reservation released
};

inline const char* toString(OutcomeKind k) {
  switch (k) {
    case OutcomeKind::DataUnavailable: return "data_unavailable";
    case OutcomeKind::StaleData:       return "stale_data";
    case OutcomeKind::NoDecision:      return "no_decision";
    case OutcomeKind::Held:            return "held";
    case OutcomeKind::SignalOnly:      return "signal_only";
    case OutcomeKind::Skipped:         return "skipped";
    case OutcomeKind::Rejected:        return "rejected";
    case OutcomeKind::Filled:          return "filled";
    case OutcomeKind::Failed:          return "failed";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// CycleOutcome — per-cycle record handed to portfolio memory
// -----------------------------------------------------------------------------
//
// @brief  Every cycle ends with exactly one CycleOutcome, including cycles
//         that never reached Learning. It is published as CycleCompletedEvent
//         and passed to IPortfolioMemory::recordCycleOutcome().
//
// @details
// path lists the states the cycle visited in order, starting with the
// state that opened it (Perception).
// -----------------------------------------------------------------------------
struct CycleOutcome {
  std::uint64_t cycle_id{0};
  std::string asset_pair;
  std::string decision_id;
  OutcomeKind kind{OutcomeKind::NoDecision};
  std::string reason;
  std::string reservation_id;
  std::string trade_id;
  std::int64_t started_at_ms{0};
  std::int64_t ended_at_ms{0};
  std::vector<AgentState> path;
};

}  // namespace domain
}  // namespace tradeloop
