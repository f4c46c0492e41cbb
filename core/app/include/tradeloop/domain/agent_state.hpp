#pragma once

#include <cstdint>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// AgentState — stage of the autonomous decision loop
// -----------------------------------------------------------------------------
//
// @brief  Closed set of stages an agent can be in. Exactly one is current at
//         any time; only the transition function in
//         tradeloop/engine/state_machine.hpp may change it.
//
// @details
// Normal cycle:
//   Recovering (once) → Perception → Reasoning → RiskCheck
//                     → Execution → Learning → Idle → Perception ...
//
// Early exits go back to Idle (Perception, Reasoning) or skip straight to
// Learning (RiskCheck). The full table is enforced by nextState().
//
// Thread model:
//   Plain enum. The agent stores it in a std::atomic so observers (the IPC
//   STATUS command) may read it from any thread.
// -----------------------------------------------------------------------------
enum class AgentState : std::uint8_t {
  Idle,
  Recovering,
  Perception,
  Reasoning,
  RiskCheck,
  Execution,
  Learning
};

inline const char* toString(AgentState s) {
  switch (s) {
    case AgentState::Idle:       return "IDLE";
    case AgentState::Recovering: return "RECOVERING";
    case AgentState::Perception: return "PERCEPTION";
    case AgentState::Reasoning:  return "REASONING";
    case AgentState::RiskCheck:  return "RISK_CHECK";
    case AgentState::Execution:  return "EXECUTION";
    case AgentState::Learning:   return "LEARNING";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradeloop
