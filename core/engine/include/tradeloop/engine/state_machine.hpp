#pragma once

#include "tradeloop/domain/agent_state.hpp"

#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// AgentTrigger — the stage outcomes that move the agent between states
// -----------------------------------------------------------------------------
enum class AgentTrigger : std::uint8_t {
  RecoveryFinished,     // Recovering → Perception
  ScheduleTick,         // Idle → Perception
  SnapshotFresh,        // Perception → Reasoning
  SnapshotUnusable,     // Perception → Idle
  DecisionProduced,     // Reasoning → RiskCheck
  DecisionUnavailable,  // Reasoning → Idle
  TradeApproved,        // RiskCheck → Execution
  TradeNotExecutable,   // RiskCheck → Learning
  ExecutionFinished,    // Execution → Learning
  LearningFinished,     // Learning → Idle
};

const char* toString(AgentTrigger trigger);

// -----------------------------------------------------------------------------
// nextState(state, trigger)
// -----------------------------------------------------------------------------
// @brief  The agent's transition table. The only code that decides where a
//         trigger leads.
//
// @throws IllegalTransitionError for any (state, trigger) pair not listed
//         next to AgentTrigger above.
// -----------------------------------------------------------------------------
domain::AgentState nextState(domain::AgentState state, AgentTrigger trigger);

// Same table, without throwing.
bool isLegalTransition(domain::AgentState state, AgentTrigger trigger);

}  // namespace tradeloop
