// =============================================================================
// trading_agent_test.cpp
// =============================================================================
// Integration tests for tradeloop::TradingAgent: the full decision loop
// against scripted fakes of every port.
//
// Validates:
//   - Startup recovery: excess positions closed, zero positions, failed
//     close halts in RECOVERING; adopted positions reach portfolio memory
//   - Stale snapshot ends the cycle in PERCEPTION, no decision requested
//   - Correlation rejection goes RISK_CHECK → LEARNING with a cooldown entry,
//     and the repeat proposal is rejected as cooldown_active
//   - Approved SELL whose submission times out: reservation Released,
//     trade_failed, then LEARNING
//   - Fill path: reservation Committed, trade_executed, daily counter
//   - A timed-out order filled later is counted and published as
//     trade_late_filled; its pair takes no new order until then
//   - max_daily_trades == 0 means no daily limit
//   - A successful provider call resets the pair's failure budget
//   - Hold, signal-only, policy skips, provider failures and the per-pair
//     failure budget
//   - Kill switch halts the agent
//   - Invariant violations halt the agent and are rethrown
//   - A halted agent's context can be exported from any state
//   - An empty asset pair list is a configuration error
//   - Every published transition is legal; no Held reservation survives a
//     cycle
//
// Every test drives tick() by hand on the test thread; no loop thread runs.
// =============================================================================

#include "tradeloop/config/agent_config.hpp"
#include "tradeloop/domain/errors.hpp"
#include "tradeloop/engine/agent_context.hpp"
#include "tradeloop/engine/state_machine.hpp"
#include "tradeloop/engine/trading_agent.hpp"
#include "tradeloop/eventbus/event_bus.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/risk/rejection_cache.hpp"
#include "tradeloop/time/simulation_time_provider.hpp"
#include "tradeloop/time/time_utils.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tradeloop;
using namespace std::chrono_literals;
using domain::Action;
using domain::AgentState;
using domain::OutcomeKind;
using domain::ReservationStatus;
using tradeloop::fakes::FakeDecisionProvider;
using tradeloop::fakes::FakeMarketDataSource;
using tradeloop::fakes::FakePortfolioMemory;
using tradeloop::fakes::FakeTradeMonitor;
using tradeloop::fakes::FakeTradingVenue;
using tradeloop::fakes::makeDecision;
using tradeloop::fakes::makePosition;
using tradeloop::fakes::makeSnapshot;
using tradeloop::fakes::zigzagReturns;

namespace {
constexpr std::int64_t kT0 = 1'700'000'000'000;
constexpr std::int64_t kMinute = 60'000;
}  // namespace

// =============================================================================
// Fixture
// =============================================================================
// Builds the agent lazily (makeAgent) so each test can adjust config first.
// Collaborators are declared before the agent so they outlive its
// BoundedCallers.
// =============================================================================
class TradingAgentTest : public ::testing::Test {
 protected:
  TradingAgentTest() : clock(kT0), cache(15 * kMinute) {
    config.asset_pairs = {"BTCUSD"};
    config.min_confidence = 0.6;
    config.max_daily_trades = 5;
    config.kill_switch_loss_pct = 0.10;
    config.max_analysis_failures = 3;

    config.risk.max_data_age_ms = 15 * kMinute;
    config.risk.cooldown_ms = 15 * kMinute;

    config.execution.order_timeout = 1000ms;
    config.execution.max_reservation_age_ms = 5 * kMinute;

    config.recovery.enabled = false;
    config.recovery.max_concurrent_trades = 2;
    config.recovery.fetch_timeout = 1000ms;
    config.recovery.fetch_backoff = 1ms;
    config.recovery.close_timeout = 1000ms;

    config.market_data_policy = domain::RetryPolicy::once(1000ms);
    config.decision_policy = domain::RetryPolicy::once(1000ms);
    config.venue_query_policy = domain::RetryPolicy::once(1000ms);

    market.set(makeSnapshot("BTCUSD", 100.0, kT0));
    venue.setBalance(100000.0, 100000.0);

    bus.subscribe([this](const Event& e) { events.push_back(e); });
  }

  void makeAgent(AgentContext context = AgentContext{}) {
    AgentPorts ports{market, provider, venue, monitor, memory};
    agent = std::make_unique<TradingAgent>(config, ports, bus, ledger, cache,
                                           clock, std::move(context));
  }

  // Ticks from Idle until the agent is back in Idle (or halted).
  std::vector<AgentState> runCycle() {
    std::vector<AgentState> states;
    for (int i = 0; i < 10; ++i) {
      states.push_back(agent->tick());
      if (states.back() == AgentState::Idle || agent->halted()) {
        break;
      }
    }
    return states;
  }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<T>(&e)) {
        out.push_back(*p);
      }
    }
    return out;
  }

  void allowBuy(double confidence = 0.9) {
    provider.setDecision(makeDecision("BTCUSD", Action::Buy, confidence));
  }

  SimulationTimeProvider clock;
  AgentConfig config;
  EventBus bus;
  ExposureLedger ledger;
  RejectionCache cache;

  FakeMarketDataSource market;
  FakeDecisionProvider provider;
  FakeTradingVenue venue;
  FakeTradeMonitor monitor;
  FakePortfolioMemory memory;

  std::vector<Event> events;
  std::unique_ptr<TradingAgent> agent;
};

// =============================================================================
// Recovery
// =============================================================================

// -----------------------------------------------------------------------------
// Three live positions, max_concurrent_trades = 2: one close, then the first
// cycle starts.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, RecoveryClosesExcessPositionAndStartsCycle) {
  config.recovery.enabled = true;
  venue.setPositions({makePosition("P-1", "BTCUSD", 10.0, kT0 - 3000),
                      makePosition("P-2", "ETHUSD", -50.0, kT0 - 2000),
                      makePosition("P-3", "SOLUSD", -1.0, kT0 - 1000)});
  makeAgent();
  ASSERT_EQ(agent->state(), AgentState::Recovering);

  EXPECT_EQ(agent->tick(), AgentState::Perception);

  auto complete = eventsOf<RecoveryCompleteEvent>();
  ASSERT_EQ(complete.size(), 1u);
  EXPECT_EQ(complete[0].positions_found, 3u);
  EXPECT_EQ(complete[0].actions_taken, 1u);
  EXPECT_EQ(complete[0].closed_position_ids,
            (std::vector<std::string>{"P-2"}));
  EXPECT_EQ(venue.closeAttempts(), (std::vector<std::string>{"P-2"}));
  EXPECT_TRUE(eventsOf<RecoveryFailedEvent>().empty());

  auto recovered = memory.recovered();
  ASSERT_EQ(recovered.size(), 2u);
  EXPECT_EQ(recovered[0].second.id, "P-1");
  EXPECT_EQ(recovered[1].second.id, "P-3");
  EXPECT_EQ(recovered[0].first.rfind("RECOVERED_BTCUSD_", 0), 0u);
}

TEST_F(TradingAgentTest, RecoveryWithNoPositionsTakesNoAction) {
  config.recovery.enabled = true;
  makeAgent();

  EXPECT_EQ(agent->tick(), AgentState::Perception);

  auto complete = eventsOf<RecoveryCompleteEvent>();
  ASSERT_EQ(complete.size(), 1u);
  EXPECT_EQ(complete[0].positions_found, 0u);
  EXPECT_EQ(complete[0].actions_taken, 0u);
  EXPECT_TRUE(venue.closeAttempts().empty());
}

TEST_F(TradingAgentTest, RecoveryFetchFailureProceedsDegraded) {
  config.recovery.enabled = true;
  venue.failPositionFetches(2);
  makeAgent();

  EXPECT_EQ(agent->tick(), AgentState::Perception);

  auto complete = eventsOf<RecoveryCompleteEvent>();
  ASSERT_EQ(complete.size(), 1u);
  EXPECT_TRUE(complete[0].degraded);
  EXPECT_EQ(venue.positionFetches(), 2);
}

TEST_F(TradingAgentTest, RecoveryCloseFailureHaltsInRecovering) {
  config.recovery.enabled = true;
  config.recovery.max_concurrent_trades = 1;
  venue.setPositions({makePosition("P-1", "BTCUSD", -10.0, kT0),
                      makePosition("P-2", "ETHUSD", 5.0, kT0)});
  venue.failCloseOf("P-1");
  makeAgent();

  EXPECT_EQ(agent->tick(), AgentState::Recovering);

  EXPECT_TRUE(agent->halted());
  EXPECT_EQ(eventsOf<RecoveryFailedEvent>().size(), 1u);
  EXPECT_TRUE(eventsOf<RecoveryCompleteEvent>().empty());
  EXPECT_EQ(eventsOf<AgentHaltedEvent>().size(), 1u);
  EXPECT_TRUE(eventsOf<StateTransitionEvent>().empty());

  // Halted: further ticks do nothing.
  EXPECT_EQ(agent->tick(), AgentState::Recovering);
  EXPECT_EQ(venue.closeAttempts().size(), 1u);
}

// =============================================================================
// Perception
// =============================================================================

// -----------------------------------------------------------------------------
// A snapshot collected two hours ago against a 15 minute threshold: the
// cycle ends in PERCEPTION → IDLE and the provider is never asked.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, StaleSnapshotEndsCycleWithoutDecision) {
  market.set(makeSnapshot("BTCUSD", 100.0, kT0 - 120 * kMinute));
  allowBuy();
  makeAgent();

  auto states = runCycle();

  EXPECT_EQ(states, (std::vector<AgentState>{AgentState::Perception,
                                             AgentState::Idle}));
  auto stale = eventsOf<DataFreshnessFailedEvent>();
  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale[0].asset_pair, "BTCUSD");
  EXPECT_EQ(stale[0].age_ms, 120 * kMinute);
  EXPECT_EQ(stale[0].threshold_ms, 15 * kMinute);
  EXPECT_EQ(provider.calls(), 0);

  auto outcome = agent->lastOutcome();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->kind, OutcomeKind::StaleData);
  EXPECT_EQ(outcome->path, (std::vector<AgentState>{AgentState::Perception,
                                                    AgentState::Idle}));
}

TEST_F(TradingAgentTest, MarketDataFailureEndsCycle) {
  market.setFailing(true);
  makeAgent();

  runCycle();

  EXPECT_EQ(eventsOf<MarketDataUnavailableEvent>().size(), 1u);
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::DataUnavailable);
  EXPECT_EQ(provider.calls(), 0);
}

TEST_F(TradingAgentTest, SnapshotWithoutPriceIsUnusable) {
  config.asset_pairs = {"ETHUSD"};
  market.set(makeSnapshot("ETHUSD", 0.0, kT0));
  makeAgent();

  runCycle();

  auto unavailable = eventsOf<MarketDataUnavailableEvent>();
  ASSERT_EQ(unavailable.size(), 1u);
  EXPECT_EQ(unavailable[0].error, "snapshot has no price");
}

// -----------------------------------------------------------------------------
// Unrealized loss of 20% of equity with a 10% kill switch.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, KillSwitchHaltsAgent) {
  venue.setBalance(10000.0, 10000.0);
  venue.setPositions({makePosition("P-1", "BTCUSD", -2000.0, kT0)});
  allowBuy();
  makeAgent();

  runCycle();

  EXPECT_TRUE(agent->halted());
  EXPECT_EQ(agent->state(), AgentState::Idle);
  EXPECT_NE(agent->haltReason().find("kill switch"), std::string::npos);
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Skipped);
  EXPECT_EQ(market.calls(), 0);
  EXPECT_TRUE(venue.orders().empty());
  EXPECT_EQ(eventsOf<AgentHaltedEvent>().size(), 1u);
}

TEST_F(TradingAgentTest, PairsAreVisitedRoundRobin) {
  config.asset_pairs = {"BTCUSD", "ETHUSD"};
  market.set(makeSnapshot("ETHUSD", 50.0, kT0));
  makeAgent();

  runCycle();
  runCycle();
  runCycle();

  auto outcomes = memory.outcomes();
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_EQ(outcomes[0].asset_pair, "BTCUSD");
  EXPECT_EQ(outcomes[1].asset_pair, "ETHUSD");
  EXPECT_EQ(outcomes[2].asset_pair, "BTCUSD");
}

// =============================================================================
// Reasoning
// =============================================================================
TEST_F(TradingAgentTest, NoDecisionEndsCycleInReasoning) {
  provider.setDecision(std::nullopt);
  makeAgent();

  auto states = runCycle();

  EXPECT_EQ(states, (std::vector<AgentState>{AgentState::Perception,
                                             AgentState::Reasoning,
                                             AgentState::Idle}));
  auto unavailable = eventsOf<DecisionUnavailableEvent>();
  ASSERT_EQ(unavailable.size(), 1u);
  EXPECT_EQ(unavailable[0].reason, "no decision");
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::NoDecision);
}

// -----------------------------------------------------------------------------
// Three provider failures exhaust the pair's budget; the fourth cycle does
// not call the provider at all. After the decay window it is asked again.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, ProviderFailureBudgetSkipsPair) {
  provider.setFailing(true);
  makeAgent();

  runCycle();
  runCycle();
  runCycle();
  EXPECT_EQ(provider.calls(), 3);

  runCycle();
  EXPECT_EQ(provider.calls(), 3);
  EXPECT_NE(agent->lastOutcome()->reason.find("failure limit"),
            std::string::npos);

  clock.advance_by(config.analysis_failure_decay_ms + 1);
  market.set(makeSnapshot("BTCUSD", 100.0, clock.now_ms()));
  provider.setFailing(false);
  provider.setDecision(std::nullopt);
  runCycle();
  EXPECT_EQ(provider.calls(), 4);
}

// -----------------------------------------------------------------------------
// Two failures, then a successful call: the budget starts over, so three
// more failures are needed before the pair is skipped.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, SuccessfulCallResetsFailureBudget) {
  provider.setFailing(true);
  makeAgent();

  runCycle();
  runCycle();
  EXPECT_EQ(provider.calls(), 2);

  provider.setFailing(false);
  provider.setDecision(std::nullopt);
  runCycle();
  EXPECT_EQ(provider.calls(), 3);
  EXPECT_EQ(agent->exportContext().failureCount("BTCUSD"), 0u);

  provider.setFailing(true);
  runCycle();
  runCycle();
  runCycle();
  EXPECT_EQ(provider.calls(), 6);

  runCycle();
  EXPECT_EQ(provider.calls(), 6);
  EXPECT_NE(agent->lastOutcome()->reason.find("failure limit"),
            std::string::npos);
}

TEST_F(TradingAgentTest, OutOfRangeConfidenceIsUnavailable) {
  provider.setDecision(makeDecision("BTCUSD", Action::Buy, 1.5));
  makeAgent();

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::NoDecision);
  EXPECT_TRUE(venue.orders().empty());
}

TEST_F(TradingAgentTest, DecisionForOtherPairIsUnavailable) {
  provider.setDecision(makeDecision("ETHUSD", Action::Buy, 0.9));
  makeAgent();

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::NoDecision);
  EXPECT_EQ(agent->lastOutcome()->reason, "decision is for ETHUSD");
}

// =============================================================================
// RiskCheck
// =============================================================================

// -----------------------------------------------------------------------------
// BUY at 0.8 with two correlated positions open (limit 2 assets): rejected
// with correlation_limit, the cycle goes RISK_CHECK → LEARNING, and
// (BTCUSD, BUY) is in the cooldown cache.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, CorrelationRejectionGoesToLearningWithCooldown) {
  auto snapshot = makeSnapshot("BTCUSD", 100.0, kT0);
  snapshot.recent_returns = zigzagReturns(40, 0.01);
  market.set(snapshot);
  venue.setPositions({makePosition("P-ETH", "ETHUSD", 0.0, kT0),
                      makePosition("P-SOL", "SOLUSD", 0.0, kT0)});
  venue.setReturns("ETHUSD", zigzagReturns(40, 0.02));
  venue.setReturns("SOLUSD", zigzagReturns(40, 0.03));
  provider.setDecision(makeDecision("BTCUSD", Action::Buy, 0.8));
  makeAgent();

  auto states = runCycle();

  EXPECT_EQ(states, (std::vector<AgentState>{
                        AgentState::Perception, AgentState::Reasoning,
                        AgentState::RiskCheck, AgentState::Learning,
                        AgentState::Idle}));

  auto rejected = eventsOf<RiskRejectedEvent>();
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0].reason, domain::RejectionReason::CorrelationLimit);
  EXPECT_EQ(rejected[0].action, Action::Buy);
  EXPECT_EQ(rejected[0].decision_id, "DEC-1");
  EXPECT_DOUBLE_EQ(rejected[0].telemetry.at("correlated_count"), 2.0);

  EXPECT_TRUE(cache.active("BTCUSD", Action::Buy, kT0).has_value());
  EXPECT_TRUE(venue.orders().empty());
  EXPECT_EQ(ledger.heldCount(), 0u);

  auto outcome = agent->lastOutcome();
  EXPECT_EQ(outcome->kind, OutcomeKind::Rejected);
  EXPECT_EQ(outcome->reason, "correlation_limit");

  // Same proposal next cycle: short-circuited by the cooldown.
  runCycle();
  rejected = eventsOf<RiskRejectedEvent>();
  ASSERT_EQ(rejected.size(), 2u);
  EXPECT_EQ(rejected[1].reason, domain::RejectionReason::CooldownActive);
}

TEST_F(TradingAgentTest, HoldGoesStraightToLearning) {
  provider.setDecision(makeDecision("BTCUSD", Action::Hold, 0.5));
  makeAgent();

  auto states = runCycle();

  EXPECT_EQ(states, (std::vector<AgentState>{
                        AgentState::Perception, AgentState::Reasoning,
                        AgentState::RiskCheck, AgentState::Learning,
                        AgentState::Idle}));
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Held);
  EXPECT_TRUE(venue.orders().empty());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TradingAgentTest, MissingPortfolioRunsSignalOnly) {
  venue.setQueriesFailing(true);
  allowBuy();
  makeAgent();

  runCycle();

  EXPECT_FALSE(provider.lastHadPortfolio());
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::SignalOnly);
  EXPECT_TRUE(venue.orders().empty());
}

TEST_F(TradingAgentTest, LowConfidenceIsSkippedWithoutCooldown) {
  allowBuy(0.4);
  makeAgent();

  runCycle();

  auto skipped = eventsOf<DecisionSkippedEvent>();
  ASSERT_EQ(skipped.size(), 1u);
  EXPECT_NE(skipped[0].reason.find("confidence"), std::string::npos);
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Skipped);
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_TRUE(eventsOf<RiskRejectedEvent>().empty());
}

TEST_F(TradingAgentTest, AutonomousExecutionOffSkips) {
  config.autonomous_execution = false;
  allowBuy();
  makeAgent();

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Skipped);
  EXPECT_TRUE(venue.orders().empty());
}

TEST_F(TradingAgentTest, DailyTradeLimitSkips) {
  AgentContext context;
  context.trading_day = utc_day_index(kT0);
  context.daily_trade_count = 5;
  allowBuy();
  makeAgent(context);

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Skipped);
  EXPECT_NE(agent->lastOutcome()->reason.find("daily trade limit"),
            std::string::npos);
}

TEST_F(TradingAgentTest, ZeroDailyLimitMeansUnlimited) {
  config.max_daily_trades = 0;
  AgentContext context;
  context.trading_day = utc_day_index(kT0);
  context.daily_trade_count = 50;
  allowBuy();
  makeAgent(context);

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Filled);
  EXPECT_EQ(agent->dailyTradeCount(), 51);
}

TEST_F(TradingAgentTest, DailyCounterResetsOnNewDay) {
  AgentContext context;
  context.trading_day = utc_day_index(kT0) - 1;
  context.daily_trade_count = 5;
  allowBuy();
  makeAgent(context);

  runCycle();

  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Filled);
  EXPECT_EQ(agent->dailyTradeCount(), 1);
}

// =============================================================================
// Execution
// =============================================================================
TEST_F(TradingAgentTest, ApprovedBuyIsFilledAndCommitted) {
  allowBuy();
  makeAgent();

  auto states = runCycle();

  EXPECT_EQ(states, (std::vector<AgentState>{
                        AgentState::Perception, AgentState::Reasoning,
                        AgentState::RiskCheck, AgentState::Execution,
                        AgentState::Learning, AgentState::Idle}));

  auto executed = eventsOf<TradeExecutedEvent>();
  ASSERT_EQ(executed.size(), 1u);
  EXPECT_EQ(executed[0].trade_id, "T-1");
  EXPECT_EQ(executed[0].decision_id, "DEC-1");
  // 100000 * 1% / (100 * 2%) = 500 units, capped at 10% of equity = 100.
  EXPECT_DOUBLE_EQ(executed[0].size, 100.0);

  auto reservation = ledger.find(executed[0].reservation_id);
  ASSERT_TRUE(reservation.has_value());
  EXPECT_EQ(reservation->status, ReservationStatus::Committed);
  EXPECT_EQ(agent->dailyTradeCount(), 1);

  auto associations = monitor.associations();
  ASSERT_EQ(associations.size(), 1u);
  EXPECT_EQ(associations[0].decision_id, "DEC-1");

  auto outcome = agent->lastOutcome();
  EXPECT_EQ(outcome->kind, OutcomeKind::Filled);
  EXPECT_EQ(outcome->trade_id, "T-1");
  EXPECT_EQ(outcome->reservation_id, executed[0].reservation_id);
}

// -----------------------------------------------------------------------------
// Approved SELL, venue submission hangs past the order timeout: the
// reservation ends Released, trade_failed is emitted and the cycle proceeds
// to LEARNING.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, SellTimeoutReleasesReservationAndProceeds) {
  config.execution.order_timeout = 30ms;
  venue.setOrderDelay(300ms);
  provider.setDecision(makeDecision("BTCUSD", Action::Sell, 0.8));
  makeAgent();

  agent->tick();  // Perception
  agent->tick();  // Reasoning
  agent->tick();  // RiskCheck
  EXPECT_EQ(agent->tick(), AgentState::Execution);
  EXPECT_EQ(agent->tick(), AgentState::Learning);

  auto failed = eventsOf<TradeFailedEvent>();
  ASSERT_EQ(failed.size(), 1u);
  auto reservation = ledger.find(failed[0].reservation_id);
  ASSERT_TRUE(reservation.has_value());
  EXPECT_EQ(reservation->status, ReservationStatus::Released);
  EXPECT_EQ(ledger.heldCount(), 0u);
  EXPECT_TRUE(eventsOf<TradeExecutedEvent>().empty());
  EXPECT_EQ(venue.orders().size(), 1u);
  EXPECT_EQ(agent->dailyTradeCount(), 0);

  EXPECT_EQ(agent->tick(), AgentState::Idle);
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Failed);
}

// -----------------------------------------------------------------------------
// The venue fills the timed-out BUY at 300 ms. A second BUY while the first
// is unresolved is refused without reaching the venue; once the fill lands
// the next cycle counts it and publishes trade_late_filled.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, LateFillIsCountedOnNextCycle) {
  config.execution.order_timeout = 30ms;
  venue.setOrderDelay(300ms);
  allowBuy();
  makeAgent();

  runCycle();
  ASSERT_EQ(eventsOf<TradeFailedEvent>().size(), 1u);
  EXPECT_EQ(agent->dailyTradeCount(), 0);

  runCycle();
  auto failed = eventsOf<TradeFailedEvent>();
  ASSERT_EQ(failed.size(), 2u);
  EXPECT_NE(failed[1].error.find("unresolved"), std::string::npos);
  EXPECT_TRUE(failed[1].reservation_id.empty());
  EXPECT_EQ(venue.orders().size(), 1u);

  provider.setDecision(std::nullopt);
  std::this_thread::sleep_for(600ms);
  runCycle();

  auto late = eventsOf<TradeLateFilledEvent>();
  ASSERT_EQ(late.size(), 1u);
  EXPECT_EQ(late[0].decision_id, "DEC-1");
  EXPECT_EQ(late[0].trade_id, "T-1");
  EXPECT_EQ(late[0].asset_pair, "BTCUSD");
  EXPECT_EQ(late[0].reservation_id, failed[0].reservation_id);
  EXPECT_DOUBLE_EQ(late[0].size, 100.0);
  EXPECT_EQ(agent->dailyTradeCount(), 1);
  EXPECT_EQ(agent->exportContext().daily_trade_count, 1);

  auto associations = monitor.associations();
  ASSERT_EQ(associations.size(), 1u);
  EXPECT_EQ(associations[0].decision_id, "DEC-1");
  EXPECT_EQ(ledger.heldCount(), 0u);
}

TEST_F(TradingAgentTest, LateFillCountsTowardDailyLimit) {
  config.max_daily_trades = 1;
  config.execution.order_timeout = 30ms;
  venue.setOrderDelay(300ms);
  allowBuy();
  makeAgent();

  runCycle();
  venue.setOrderDelay(0ms);
  std::this_thread::sleep_for(600ms);
  runCycle();

  EXPECT_EQ(eventsOf<TradeLateFilledEvent>().size(), 1u);
  EXPECT_EQ(agent->lastOutcome()->kind, OutcomeKind::Skipped);
  EXPECT_NE(agent->lastOutcome()->reason.find("daily trade limit"),
            std::string::npos);
  EXPECT_EQ(venue.orders().size(), 1u);
}

// -----------------------------------------------------------------------------
// A Held reservation already on the pair makes execution an invariant
// violation: logged, agent halted, exception rethrown.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, InvariantViolationHaltsAndRethrows) {
  ledger.reserve("DEC-X", "BTCUSD", 1.0, 1.0, kT0);
  allowBuy();
  makeAgent();

  agent->tick();
  agent->tick();
  agent->tick();
  ASSERT_EQ(agent->tick(), AgentState::Execution);

  EXPECT_THROW(agent->tick(), InvariantViolation);
  EXPECT_TRUE(agent->halted());
  EXPECT_NE(agent->haltReason().find("invariant violation"),
            std::string::npos);
  EXPECT_TRUE(venue.orders().empty());
  EXPECT_EQ(agent->tick(), AgentState::Execution);
}

TEST_F(TradingAgentTest, StaleReservationsAreSweptWhileIdle) {
  auto stale = ledger.reserve("DEC-X", "ETHUSD", 1.0, 1.0, kT0);
  clock.advance_by(config.execution.max_reservation_age_ms + 1);
  market.set(makeSnapshot("BTCUSD", 100.0, clock.now_ms()));
  provider.setDecision(std::nullopt);
  makeAgent();

  agent->tick();

  auto swept = eventsOf<ReservationsSweptEvent>();
  ASSERT_EQ(swept.size(), 1u);
  EXPECT_EQ(swept[0].reservation_ids, (std::vector<std::string>{stale}));
  EXPECT_EQ(ledger.find(stale)->status, ReservationStatus::Released);
}

// =============================================================================
// Learning and bookkeeping
// =============================================================================
TEST_F(TradingAgentTest, LearningRecordsClosedTrades) {
  domain::ClosedTrade trade;
  trade.trade_id = "T-OLD";
  trade.decision_id = "DEC-OLD";
  trade.asset_pair = "BTCUSD";
  trade.realized_pnl = 12.5;
  monitor.addClosed(trade);
  provider.setDecision(makeDecision("BTCUSD", Action::Hold, 0.5));
  makeAgent();

  runCycle();

  auto trades = memory.trades();
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].trade_id, "T-OLD");

  runCycle();
  EXPECT_EQ(memory.trades().size(), 1u);
}

TEST_F(TradingAgentTest, EveryCycleRecordsOneOutcome) {
  makeAgent();

  runCycle();  // no decision
  allowBuy();
  runCycle();  // filled

  auto outcomes = memory.outcomes();
  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_EQ(outcomes[0].cycle_id, 1u);
  EXPECT_EQ(outcomes[1].cycle_id, 2u);
  EXPECT_EQ(eventsOf<CycleCompletedEvent>().size(), 2u);
  EXPECT_EQ(agent->cyclesCompleted(), 2u);
}

TEST_F(TradingAgentTest, CycleIdsContinueFromSavedContext) {
  AgentContext context;
  context.cycles_completed = 41;
  makeAgent(context);

  runCycle();

  EXPECT_EQ(memory.outcomes().at(0).cycle_id, 42u);
  EXPECT_EQ(agent->exportContext().cycles_completed, 42u);
}

// -----------------------------------------------------------------------------
// Shutdown halts the agent in the middle of a cycle. The context is final
// and can still be saved; importing is still refused.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, HaltedAgentExportsContextMidCycle) {
  AgentContext context;
  context.trading_day = utc_day_index(kT0);
  context.daily_trade_count = 3;
  context.cycles_completed = 7;
  allowBuy();
  makeAgent(context);

  agent->tick();
  ASSERT_EQ(agent->tick(), AgentState::Reasoning);
  EXPECT_THROW(agent->exportContext(), std::logic_error);

  agent->halt("shutdown during REASONING");

  AgentContext saved;
  ASSERT_NO_THROW(saved = agent->exportContext());
  EXPECT_EQ(saved.daily_trade_count, 3);
  EXPECT_EQ(saved.cycles_completed, 7u);
  EXPECT_THROW(agent->importContext(AgentContext{}), std::logic_error);
}

TEST_F(TradingAgentTest, EmptyAssetPairsIsConfigError) {
  config.asset_pairs.clear();
  EXPECT_THROW(makeAgent(), ConfigError);
}

TEST_F(TradingAgentTest, ContextOnlyExportedBetweenCycles) {
  makeAgent();
  agent->tick();

  EXPECT_THROW(agent->exportContext(), std::logic_error);
  EXPECT_THROW(agent->importContext(AgentContext{}), std::logic_error);

  while (agent->tick() != AgentState::Idle) {
  }
  EXPECT_NO_THROW(agent->exportContext());
}

// -----------------------------------------------------------------------------
// Over a mix of cycle shapes, every published transition is in the table and
// no Held reservation outlives its cycle.
// -----------------------------------------------------------------------------
TEST_F(TradingAgentTest, PublishedTransitionsAreAllLegal) {
  config.recovery.enabled = true;
  makeAgent();

  agent->tick();  // recovery
  while (agent->tick() != AgentState::Idle) {
  }
  allowBuy();
  runCycle();
  provider.setDecision(makeDecision("BTCUSD", Action::Hold, 0.5));
  runCycle();
  market.set(makeSnapshot("BTCUSD", 100.0, kT0 - 60 * kMinute));
  runCycle();

  auto transitions = eventsOf<StateTransitionEvent>();
  ASSERT_FALSE(transitions.empty());
  EXPECT_EQ(transitions.front().from, AgentState::Recovering);
  for (std::size_t i = 0; i < transitions.size(); ++i) {
    const auto& t = transitions[i];
    EXPECT_NE(t.from, t.to);
    if (i > 0) {
      EXPECT_EQ(t.from, transitions[i - 1].to);
    }
  }
  EXPECT_EQ(ledger.heldCount(), 0u);
  EXPECT_FALSE(agent->halted());
}

TEST_F(TradingAgentTest, HaltIsIdempotent) {
  makeAgent();

  agent->halt("operator");
  agent->halt("again");

  EXPECT_TRUE(agent->halted());
  EXPECT_EQ(agent->haltReason(), "operator");
  EXPECT_EQ(eventsOf<AgentHaltedEvent>().size(), 1u);
  EXPECT_EQ(agent->tick(), AgentState::Idle);
  EXPECT_EQ(market.calls(), 0);
}
