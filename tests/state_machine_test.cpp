// =============================================================================
// state_machine_test.cpp
// =============================================================================
// Unit tests for tradeloop::nextState() and isLegalTransition().
//
// Validates:
//   - Every legal (state, trigger) pair leads where the table says
//   - Every other pair throws IllegalTransitionError
//   - The error message names the state and the trigger
//   - Trigger names are stable snake_case strings
// =============================================================================

#include "tradeloop/domain/errors.hpp"
#include "tradeloop/engine/state_machine.hpp"

#include <gtest/gtest.h>

#include <string>
#include <tuple>
#include <vector>

using tradeloop::AgentTrigger;
using tradeloop::domain::AgentState;

namespace {

const std::vector<AgentState> kAllStates = {
    AgentState::Idle,      AgentState::Recovering, AgentState::Perception,
    AgentState::Reasoning, AgentState::RiskCheck,  AgentState::Execution,
    AgentState::Learning};

const std::vector<AgentTrigger> kAllTriggers = {
    AgentTrigger::RecoveryFinished,   AgentTrigger::ScheduleTick,
    AgentTrigger::SnapshotFresh,      AgentTrigger::SnapshotUnusable,
    AgentTrigger::DecisionProduced,   AgentTrigger::DecisionUnavailable,
    AgentTrigger::TradeApproved,      AgentTrigger::TradeNotExecutable,
    AgentTrigger::ExecutionFinished,  AgentTrigger::LearningFinished};

using Row = std::tuple<AgentState, AgentTrigger, AgentState>;

const std::vector<Row> kLegal = {
    {AgentState::Recovering, AgentTrigger::RecoveryFinished, AgentState::Perception},
    {AgentState::Idle, AgentTrigger::ScheduleTick, AgentState::Perception},
    {AgentState::Perception, AgentTrigger::SnapshotFresh, AgentState::Reasoning},
    {AgentState::Perception, AgentTrigger::SnapshotUnusable, AgentState::Idle},
    {AgentState::Reasoning, AgentTrigger::DecisionProduced, AgentState::RiskCheck},
    {AgentState::Reasoning, AgentTrigger::DecisionUnavailable, AgentState::Idle},
    {AgentState::RiskCheck, AgentTrigger::TradeApproved, AgentState::Execution},
    {AgentState::RiskCheck, AgentTrigger::TradeNotExecutable, AgentState::Learning},
    {AgentState::Execution, AgentTrigger::ExecutionFinished, AgentState::Learning},
    {AgentState::Learning, AgentTrigger::LearningFinished, AgentState::Idle},
};

bool inTable(AgentState s, AgentTrigger t) {
  for (const auto& [from, trigger, to] : kLegal) {
    if (from == s && trigger == t) return true;
  }
  return false;
}

}  // namespace

TEST(StateMachineTest, LegalTransitionsFollowTable) {
  for (const auto& [from, trigger, to] : kLegal) {
    EXPECT_TRUE(tradeloop::isLegalTransition(from, trigger));
    EXPECT_EQ(tradeloop::nextState(from, trigger), to)
        << tradeloop::domain::toString(from) << " --"
        << tradeloop::toString(trigger) << "-->";
  }
}

// -----------------------------------------------------------------------------
// 7 states x 10 triggers = 70 pairs; exactly the 10 above are legal.
// -----------------------------------------------------------------------------
TEST(StateMachineTest, EveryOtherPairIsIllegal) {
  int illegal = 0;
  for (auto state : kAllStates) {
    for (auto trigger : kAllTriggers) {
      if (inTable(state, trigger)) continue;
      ++illegal;
      EXPECT_FALSE(tradeloop::isLegalTransition(state, trigger));
      EXPECT_THROW(tradeloop::nextState(state, trigger),
                   tradeloop::IllegalTransitionError)
          << tradeloop::domain::toString(state) << " --"
          << tradeloop::toString(trigger) << "-->";
    }
  }
  EXPECT_EQ(illegal, 60);
}

TEST(StateMachineTest, ExecutionIsOnlyReachableFromRiskCheck) {
  for (auto state : kAllStates) {
    for (auto trigger : kAllTriggers) {
      if (!tradeloop::isLegalTransition(state, trigger)) continue;
      if (tradeloop::nextState(state, trigger) == AgentState::Execution) {
        EXPECT_EQ(state, AgentState::RiskCheck);
        EXPECT_EQ(trigger, AgentTrigger::TradeApproved);
      }
    }
  }
}

TEST(StateMachineTest, RecoveringIsNeverReentered) {
  for (auto state : kAllStates) {
    for (auto trigger : kAllTriggers) {
      if (!tradeloop::isLegalTransition(state, trigger)) continue;
      EXPECT_NE(tradeloop::nextState(state, trigger), AgentState::Recovering);
    }
  }
}

TEST(StateMachineTest, IllegalTransitionMessageNamesStateAndTrigger) {
  try {
    tradeloop::nextState(AgentState::Idle, AgentTrigger::TradeApproved);
    FAIL() << "expected IllegalTransitionError";
  } catch (const tradeloop::IllegalTransitionError& e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("IDLE"), std::string::npos);
    EXPECT_NE(what.find("trade_approved"), std::string::npos);
  }
}

TEST(StateMachineTest, IllegalTransitionIsALogicError) {
  EXPECT_THROW(
      tradeloop::nextState(AgentState::Learning, AgentTrigger::ScheduleTick),
      std::logic_error);
}

TEST(StateMachineTest, TriggerNames) {
  EXPECT_STREQ(tradeloop::toString(AgentTrigger::ScheduleTick), "schedule_tick");
  EXPECT_STREQ(tradeloop::toString(AgentTrigger::TradeNotExecutable),
               "trade_not_executable");
  EXPECT_STREQ(tradeloop::toString(AgentTrigger::RecoveryFinished),
               "recovery_finished");
}
