#include "tradeloop/engine/state_machine.hpp"
#include "tradeloop/domain/errors.hpp"

#include <optional>
#include <string>

namespace tradeloop {

namespace {

using domain::AgentState;

std::optional<AgentState> lookup(AgentState state, AgentTrigger trigger) {
  switch (state) {
    case AgentState::Recovering:
      if (trigger == AgentTrigger::RecoveryFinished) return AgentState::Perception;
      return std::nullopt;
    case AgentState::Idle:
      if (trigger == AgentTrigger::ScheduleTick) return AgentState::Perception;
      return std::nullopt;
    case AgentState::Perception:
      if (trigger == AgentTrigger::SnapshotFresh) return AgentState::Reasoning;
      if (trigger == AgentTrigger::SnapshotUnusable) return AgentState::Idle;
      return std::nullopt;
    case AgentState::Reasoning:
      if (trigger == AgentTrigger::DecisionProduced) return AgentState::RiskCheck;
      if (trigger == AgentTrigger::DecisionUnavailable) return AgentState::Idle;
      return std::nullopt;
    case AgentState::RiskCheck:
      if (trigger == AgentTrigger::TradeApproved) return AgentState::Execution;
      if (trigger == AgentTrigger::TradeNotExecutable) return AgentState::Learning;
      return std::nullopt;
    case AgentState::Execution:
      if (trigger == AgentTrigger::ExecutionFinished) return AgentState::Learning;
      return std::nullopt;
    case AgentState::Learning:
      if (trigger == AgentTrigger::LearningFinished) return AgentState::Idle;
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace

const char* toString(AgentTrigger trigger) {
  switch (trigger) {
    case AgentTrigger::RecoveryFinished:    return "recovery_finished";
    case AgentTrigger::ScheduleTick:        return "schedule_tick";
    case AgentTrigger::SnapshotFresh:       return "snapshot_fresh";
    case AgentTrigger::SnapshotUnusable:    return "snapshot_unusable";
    case AgentTrigger::DecisionProduced:    return "decision_produced";
    case AgentTrigger::DecisionUnavailable: return "decision_unavailable";
    case AgentTrigger::TradeApproved:       return "trade_approved";
    case AgentTrigger::TradeNotExecutable:  return "trade_not_executable";
    case AgentTrigger::ExecutionFinished:   return "execution_finished";
    case AgentTrigger::LearningFinished:    return "learning_finished";
  }
  return "unknown";
}

domain::AgentState nextState(domain::AgentState state, AgentTrigger trigger) {
  auto next = lookup(state, trigger);
  if (!next) {
    throw IllegalTransitionError(std::string("illegal transition: ") +
                                 domain::toString(state) + " --" +
                                 toString(trigger) + "-->");
  }
  return *next;
}

bool isLegalTransition(domain::AgentState state, AgentTrigger trigger) {
  return lookup(state, trigger).has_value();
}

}  // namespace tradeloop
