#pragma once

#include "tradeloop/concurrent/bounded_caller.hpp"
#include "tradeloop/concurrent/id_generator.hpp"
#include "tradeloop/config/agent_config.hpp"
#include "tradeloop/domain/agent_state.hpp"
#include "tradeloop/domain/cycle_outcome.hpp"
#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/market_snapshot.hpp"
#include "tradeloop/domain/portfolio.hpp"
#include "tradeloop/engine/agent_context.hpp"
#include "tradeloop/engine/state_machine.hpp"
#include "tradeloop/eventbus/event_bus.hpp"
#include "tradeloop/execution/execution_stage.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/ports/i_decision_provider.hpp"
#include "tradeloop/ports/i_market_data_source.hpp"
#include "tradeloop/ports/i_portfolio_memory.hpp"
#include "tradeloop/ports/i_trade_monitor.hpp"
#include "tradeloop/ports/i_trading_venue.hpp"
#include "tradeloop/recovery/recovery_manager.hpp"
#include "tradeloop/risk/position_sizer.hpp"
#include "tradeloop/risk/rejection_cache.hpp"
#include "tradeloop/risk/risk_gatekeeper.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tradeloop {

// The collaborators the agent talks to. All are owned by the caller and must
// outlive the agent.
struct AgentPorts {
  IMarketDataSource& market_data;
  IDecisionProvider& decision_provider;
  ITradingVenue& venue;
  ITradeMonitor& trade_monitor;
  IPortfolioMemory& memory;
};

// -----------------------------------------------------------------------------
// TradingAgent — the autonomous decision loop
// -----------------------------------------------------------------------------
//
// @brief  Runs Perception → Reasoning → RiskCheck → Execution → Learning,
//         one stage per tick(), with recovery before the first cycle.
//
// @details
// Every state change goes through nextState() (state_machine.hpp); a stage
// handler only works out which AgentTrigger its outcome maps to. Handlers:
//
//   Recovering  RecoveryManager::run(). Unsafe → recovery_failed, halt, stay
//               in Recovering. Otherwise recovery_complete and the first
//               cycle starts.
//   Idle        Collects late fills, sweeps stale reservations and starts
//               a cycle. Pacing between cycles belongs to whoever calls
//               tick() (AgentRuntime).
//   Perception  Day rollover, round-robin pair, portfolio fetch (failure →
//               signal-only cycle), kill switch, snapshot fetch and freshness.
//   Reasoning   Decision provider with per-pair failure budget.
//   RiskCheck   Hold / signal-only / policy gate / sizing, then the
//               RiskGatekeeper.
//   Execution   ExecutionStage::execute(), daily counter, late fills,
//               stale sweep.
//   Learning    Closed trades → portfolio memory.
//
// Each cycle ends with exactly one CycleOutcome, recorded in portfolio
// memory and published as CycleCompletedEvent.
//
// Error model:
//   - Collaborator failures are values (CallOutcome) mapped to the stage's
//     fallback trigger. They never escape tick().
//   - std::logic_error (IllegalTransitionError, InvariantViolation) is a
//     bug: logged CRITICAL, agent halted, agent_halted published, rethrown.
//
// Thread model:
//   tick() is serialized by tick_mutex_. halt(), state(), halted() and the
//   status accessors are safe from any thread (IPC command handler).
//   Events are published on the thread that calls tick().
//
// Ownership:
//   Borrows the ports, bus, ledger, rejection cache and clock. Owns the
//   gatekeeper, sizer, execution stage, recovery manager and context.
// -----------------------------------------------------------------------------
class TradingAgent {
 public:
  TradingAgent(const AgentConfig& config, AgentPorts ports, EventBus& bus,
               ExposureLedger& ledger, RejectionCache& rejections,
               const ITimeProvider& time_provider,
               AgentContext context = AgentContext{});

  TradingAgent(const TradingAgent&) = delete;
  TradingAgent& operator=(const TradingAgent&) = delete;
  TradingAgent(TradingAgent&&) = delete;
  TradingAgent& operator=(TradingAgent&&) = delete;

  // -------------------------------------------------------------------------
  // tick()
  // -------------------------------------------------------------------------
  // @brief  Runs the current state's stage and applies exactly one
  //         transition (none if recovery fails). No-op once halted.
  //
  // @return State after the tick.
  // @throws std::logic_error on an illegal transition or broken invariant,
  //         after halting the agent.
  // -------------------------------------------------------------------------
  domain::AgentState tick();

  // Idempotent. Further tick() calls do nothing.
  void halt(const std::string& reason);

  domain::AgentState state() const { return state_.load(); }
  bool halted() const { return halted_.load(); }
  std::string haltReason() const;

  int dailyTradeCount() const { return daily_trades_.load(); }
  std::uint64_t cyclesCompleted() const { return cycles_completed_.load(); }
  std::optional<domain::CycleOutcome> lastOutcome() const;

  // Export: while Idle or Recovering, or any time once halted.
  // Import: only while Idle or Recovering. std::logic_error otherwise.
  AgentContext exportContext() const;
  void importContext(const AgentContext& context);

 private:
  // Per-cycle working data. Reset when a cycle starts.
  struct Cycle {
    std::uint64_t id{0};
    std::int64_t started_at_ms{0};
    std::string asset_pair;
    std::optional<domain::PortfolioSnapshot> portfolio;
    std::optional<domain::MarketSnapshot> snapshot;
    std::optional<domain::Decision> decision;
    std::optional<Verdict> verdict;
    double position_size{0.0};
    domain::CycleOutcome outcome;
  };

  void runStage();

  void onRecovering();
  void onIdle();
  void onPerception();
  void onReasoning();
  void onRiskCheck();
  void onExecution();
  void onLearning();

  // Applies nextState() and publishes the transition.
  void fire(AgentTrigger trigger);

  // Checks the preconditions of TradeApproved, then fires it.
  void fireTradeApproved();

  void startCycle();
  void setOutcome(domain::OutcomeKind kind, std::string reason);

  // Fires the trigger that returns to Idle, then records the outcome.
  void endCycle(AgentTrigger trigger);
  void finishCycle();

  void skip(const std::string& reason);
  void sweepReservations();

  // Counts timed-out orders the venue filled afterwards and publishes them.
  void collectLateFills();

  void publish(Event event);

  Timestamp now() const;

  const AgentConfig config_;
  AgentPorts ports_;
  EventBus& bus_;
  const ITimeProvider& time_provider_;

  RiskGatekeeper gatekeeper_;
  PositionSizer sizer_;
  ExecutionStage execution_;
  RecoveryManager recovery_;
  BoundedCaller caller_{"TradingAgent"};
  IdGenerator decision_ids_{"DEC"};

  mutable std::mutex tick_mutex_;
  AgentContext context_;
  std::uint64_t last_cycle_id_{0};
  std::optional<Cycle> cycle_;

  std::atomic<domain::AgentState> state_;
  std::atomic<bool> halted_{false};
  std::atomic<int> daily_trades_{0};
  std::atomic<std::uint64_t> cycles_completed_{0};

  mutable std::mutex status_mutex_;
  std::string halt_reason_;
  std::optional<domain::CycleOutcome> last_outcome_;
};

}  // namespace tradeloop
