#include "tradeloop/engine/trading_agent.hpp"
#include "tradeloop/domain/errors.hpp"
#include "tradeloop/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradeloop {

using domain::AgentState;
using domain::OutcomeKind;

TradingAgent::TradingAgent(const AgentConfig& config, AgentPorts ports,
                           EventBus& bus, ExposureLedger& ledger,
                           RejectionCache& rejections,
                           const ITimeProvider& time_provider,
                           AgentContext context)
    : config_(config),
      ports_(ports),
      bus_(bus),
      time_provider_(time_provider),
      gatekeeper_(config.risk, rejections, ledger, time_provider),
      sizer_(config.sizing),
      execution_(ledger, ports.venue, ports.trade_monitor, time_provider,
                 config.execution),
      recovery_(ports.venue, ports.trade_monitor, ports.memory, ledger,
                time_provider, config.recovery),
      context_(std::move(context)),
      state_(config.recovery.enabled ? AgentState::Recovering
                                     : AgentState::Idle) {
  if (config_.asset_pairs.empty()) {
    throw ConfigError("TradingAgent needs at least one asset pair");
  }
  last_cycle_id_ = context_.cycles_completed;
  daily_trades_.store(context_.daily_trade_count);
  cycles_completed_.store(context_.cycles_completed);
}

// -----------------------------------------------------------------------------
// tick()
// -----------------------------------------------------------------------------
AgentState TradingAgent::tick() {
  std::lock_guard lock(tick_mutex_);
  if (halted_.load()) {
    return state_.load();
  }

  try {
    runStage();
  } catch (const std::logic_error& e) {
    std::cerr << "[TradingAgent] CRITICAL: " << e.what() << " (state "
              << domain::toString(state_.load()) << ")\n";
    halt(std::string("invariant violation: ") + e.what());
    throw;
  }
  return state_.load();
}

void TradingAgent::runStage() {
  switch (state_.load()) {
    case AgentState::Recovering: onRecovering(); return;
    case AgentState::Idle:       onIdle();       return;
    case AgentState::Perception: onPerception(); return;
    case AgentState::Reasoning:  onReasoning();  return;
    case AgentState::RiskCheck:  onRiskCheck();  return;
    case AgentState::Execution:  onExecution();  return;
    case AgentState::Learning:   onLearning();   return;
  }
}

// Does not take tick_mutex_; safe while a tick is running.
void TradingAgent::halt(const std::string& reason) {
  if (halted_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(status_mutex_);
    halt_reason_ = reason;
  }
  std::cerr << "[TradingAgent] HALTED: " << reason << "\n";

  AgentHaltedEvent ev;
  ev.reason = reason;
  ev.state = state_.load();
  ev.timestamp = now();
  publish(ev);
}

std::string TradingAgent::haltReason() const {
  std::lock_guard lock(status_mutex_);
  return halt_reason_;
}

std::optional<domain::CycleOutcome> TradingAgent::lastOutcome() const {
  std::lock_guard lock(status_mutex_);
  return last_outcome_;
}

// A halted agent never resumes its cycle, so its context is final and may be
// exported from any state.
AgentContext TradingAgent::exportContext() const {
  std::lock_guard lock(tick_mutex_);
  const AgentState s = state_.load();
  if (s != AgentState::Idle && s != AgentState::Recovering &&
      !halted_.load()) {
    throw std::logic_error(
        std::string("agent context can only be exported between cycles, "
                    "current state ") +
        domain::toString(s));
  }
  return context_;
}

void TradingAgent::importContext(const AgentContext& context) {
  std::lock_guard lock(tick_mutex_);
  const AgentState s = state_.load();
  if (s != AgentState::Idle && s != AgentState::Recovering) {
    throw std::logic_error(
        std::string("agent context can only be imported between cycles, "
                    "current state ") +
        domain::toString(s));
  }
  context_ = context;
  last_cycle_id_ = std::max(last_cycle_id_, context_.cycles_completed);
  daily_trades_.store(context_.daily_trade_count);
  cycles_completed_.store(context_.cycles_completed);
}

// -----------------------------------------------------------------------------
// Recovering
// -----------------------------------------------------------------------------
void TradingAgent::onRecovering() {
  RecoveryReport report = recovery_.run();

  if (!report.safe) {
    RecoveryFailedEvent ev;
    ev.error = report.error;
    ev.positions_found = report.positions_found;
    ev.actions_taken = report.actions_taken;
    ev.timestamp = now();
    publish(ev);
    halt("recovery failed: " + report.error);
    return;
  }

  RecoveryCompleteEvent ev;
  ev.positions_found = report.positions_found;
  ev.actions_taken = report.actions_taken;
  ev.degraded = report.degraded;
  for (const auto& p : report.closed) {
    ev.closed_position_ids.push_back(p.id);
  }
  ev.timestamp = now();
  publish(ev);

  startCycle();
  fire(AgentTrigger::RecoveryFinished);
}

// -----------------------------------------------------------------------------
// Idle
// -----------------------------------------------------------------------------
void TradingAgent::onIdle() {
  collectLateFills();
  sweepReservations();
  startCycle();
  fire(AgentTrigger::ScheduleTick);
}

// -----------------------------------------------------------------------------
// Perception
// -----------------------------------------------------------------------------
void TradingAgent::onPerception() {
  Cycle& cycle = *cycle_;
  const std::int64_t now_ms = time_provider_.now_ms();

  if (context_.rollDay(utc_day_index(now_ms))) {
    daily_trades_.store(0);
    std::cout << "[TradingAgent] new trading day " << context_.trading_day
              << ", daily counters reset\n";
  }

  const auto& pairs = config_.asset_pairs;
  const std::size_t index = context_.next_pair_index % pairs.size();
  context_.next_pair_index = (index + 1) % pairs.size();
  cycle.asset_pair = pairs[index];
  cycle.outcome.asset_pair = cycle.asset_pair;

  // --- Portfolio ------------------------------------------------------------
  ITradingVenue& venue = ports_.venue;
  const std::string pair = cycle.asset_pair;
  auto fetched = caller_.call(config_.venue_query_policy, [&venue, pair] {
    domain::PortfolioSnapshot p;
    p.positions = venue.getPositions();
    p.balance = venue.getBalance();
    std::vector<std::string> assets{pair};
    for (const auto& position : p.positions) {
      if (position.asset_pair != pair) {
        assets.push_back(position.asset_pair);
      }
    }
    p.returns_by_asset = venue.getReturns(assets);
    return p;
  });

  if (fetched.ok()) {
    cycle.portfolio = std::move(*fetched.value);
    cycle.portfolio->collected_at_ms = time_provider_.now_ms();
  } else {
    std::cerr << "[TradingAgent] WARNING: portfolio unavailable ("
              << fetched.error << "); cycle runs signal-only\n";
  }

  // --- Kill switch ----------------------------------------------------------
  if (cycle.portfolio && cycle.portfolio->balance &&
      cycle.portfolio->balance->equity > 0.0) {
    const double equity = cycle.portfolio->balance->equity;
    const double unrealized = cycle.portfolio->totalUnrealizedPnl();
    if (unrealized <= -config_.kill_switch_loss_pct * equity) {
      const std::string reason =
          "kill switch: unrealized P&L " + std::to_string(unrealized) +
          " breaches " + std::to_string(config_.kill_switch_loss_pct * 100.0) +
          "% of equity " + std::to_string(equity);
      setOutcome(OutcomeKind::Skipped, reason);
      endCycle(AgentTrigger::SnapshotUnusable);
      halt(reason);
      return;
    }
  }

  // --- Snapshot -------------------------------------------------------------
  IMarketDataSource& source = ports_.market_data;
  auto snapshot = caller_.call(config_.market_data_policy, [&source, pair] {
    return source.fetchSnapshot(pair);
  });

  std::string unusable;
  if (!snapshot.ok()) {
    unusable = snapshot.error;
  } else if (snapshot.value->asset_pair != pair) {
    unusable = "snapshot is for " + snapshot.value->asset_pair;
  } else if (snapshot.value->price <= 0.0) {
    unusable = "snapshot has no price";
  }

  if (!unusable.empty()) {
    MarketDataUnavailableEvent ev;
    ev.asset_pair = pair;
    ev.error = unusable;
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);
    setOutcome(OutcomeKind::DataUnavailable, unusable);
    endCycle(AgentTrigger::SnapshotUnusable);
    return;
  }

  // --- Freshness ------------------------------------------------------------
  const std::int64_t checked_at = time_provider_.now_ms();
  const std::int64_t age = checked_at - snapshot.value->collected_at_ms;
  if (age > config_.risk.max_data_age_ms) {
    std::cerr << "[TradingAgent] stale snapshot for " << pair << ": age "
              << age << " ms > " << config_.risk.max_data_age_ms << " ms\n";

    DataFreshnessFailedEvent ev;
    ev.asset_pair = pair;
    ev.collected_at_ms = snapshot.value->collected_at_ms;
    ev.age_ms = age;
    ev.threshold_ms = config_.risk.max_data_age_ms;
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);
    setOutcome(OutcomeKind::StaleData,
               "snapshot age " + std::to_string(age) + " ms");
    endCycle(AgentTrigger::SnapshotUnusable);
    return;
  }

  cycle.snapshot = std::move(*snapshot.value);
  fire(AgentTrigger::SnapshotFresh);
}

// -----------------------------------------------------------------------------
// Reasoning
// -----------------------------------------------------------------------------
void TradingAgent::onReasoning() {
  Cycle& cycle = *cycle_;
  const std::string& pair = cycle.asset_pair;
  const std::int64_t now_ms = time_provider_.now_ms();

  auto unavailable = [this, &cycle, &pair](const std::string& reason) {
    DecisionUnavailableEvent ev;
    ev.asset_pair = pair;
    ev.reason = reason;
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);
    setOutcome(OutcomeKind::NoDecision, reason);
    endCycle(AgentTrigger::DecisionUnavailable);
  };

  context_.forgetFailuresBefore(now_ms, config_.analysis_failure_decay_ms);
  const std::size_t failures = context_.failureCount(pair);
  if (failures >= static_cast<std::size_t>(config_.max_analysis_failures)) {
    unavailable("analysis failure limit reached (" + std::to_string(failures) +
                " recent failures)");
    return;
  }

  IDecisionProvider& provider = ports_.decision_provider;
  const domain::MarketSnapshot snapshot = *cycle.snapshot;
  const std::optional<domain::PortfolioSnapshot> portfolio = cycle.portfolio;
  auto proposed =
      caller_.call(config_.decision_policy, [&provider, snapshot, portfolio] {
        return provider.proposeDecision(snapshot, portfolio);
      });

  if (!proposed.ok()) {
    context_.recordFailure(pair, time_provider_.now_ms());
    unavailable("decision provider failed: " + proposed.error);
    return;
  }
  context_.clearFailures(pair);

  if (!proposed.value->has_value()) {
    unavailable("no decision");
    return;
  }

  domain::Decision decision = std::move(**proposed.value);
  if (decision.asset_pair.empty()) {
    decision.asset_pair = pair;
  }
  if (decision.asset_pair != pair) {
    unavailable("decision is for " + decision.asset_pair);
    return;
  }
  if (!(decision.confidence >= 0.0 && decision.confidence <= 1.0)) {
    unavailable("confidence out of range: " +
                std::to_string(decision.confidence));
    return;
  }

  if (decision.id.empty()) {
    decision.id = decision_ids_.next();
  }
  if (decision.created_at_ms == 0) {
    decision.created_at_ms = time_provider_.now_ms();
  }
  if (decision.entry_price <= 0.0) {
    decision.entry_price = snapshot.price;
  }
  decision.signal_only = !cycle.portfolio || !cycle.portfolio->balance;

  std::cout << "[TradingAgent] decision " << decision.id << ": "
            << domain::toString(decision.action) << " " << pair
            << " confidence=" << decision.confidence
            << (decision.signal_only ? " (signal only)" : "") << "\n";

  cycle.outcome.decision_id = decision.id;
  cycle.decision = std::move(decision);
  fire(AgentTrigger::DecisionProduced);
}

// -----------------------------------------------------------------------------
// RiskCheck
// -----------------------------------------------------------------------------
void TradingAgent::onRiskCheck() {
  Cycle& cycle = *cycle_;
  const domain::Decision& decision = *cycle.decision;

  if (decision.action == domain::Action::Hold) {
    setOutcome(OutcomeKind::Held, "hold");
    fire(AgentTrigger::TradeNotExecutable);
    return;
  }
  if (decision.signal_only) {
    setOutcome(OutcomeKind::SignalOnly, "portfolio data unavailable");
    fire(AgentTrigger::TradeNotExecutable);
    return;
  }

  // --- Policy gate ----------------------------------------------------------
  if (decision.confidence < config_.min_confidence) {
    skip("confidence " + std::to_string(decision.confidence) +
         " below minimum " + std::to_string(config_.min_confidence));
    return;
  }
  if (config_.max_daily_trades > 0 &&
      context_.daily_trade_count >= config_.max_daily_trades) {
    skip("daily trade limit reached (" +
         std::to_string(context_.daily_trade_count) + ")");
    return;
  }
  if (!config_.autonomous_execution) {
    skip("autonomous execution disabled");
    return;
  }

  const double size =
      sizer_.size(decision, cycle.snapshot->price, cycle.portfolio->balance);
  if (size <= 0.0) {
    skip("position size is zero");
    return;
  }

  // --- Gatekeeper -----------------------------------------------------------
  Verdict verdict =
      gatekeeper_.evaluate(decision, *cycle.portfolio, *cycle.snapshot, size);

  if (!verdict.approved()) {
    const auto reason =
        verdict.reason.value_or(domain::RejectionReason::MarginLimit);

    RiskRejectedEvent ev;
    ev.asset_pair = decision.asset_pair;
    ev.decision_id = decision.id;
    ev.action = decision.action;
    ev.reason = reason;
    ev.detail = verdict.detail;
    ev.telemetry = verdict.telemetry;
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);

    setOutcome(OutcomeKind::Rejected, domain::toString(reason));
    fire(AgentTrigger::TradeNotExecutable);
    return;
  }

  cycle.verdict = std::move(verdict);
  cycle.position_size = size;
  fireTradeApproved();
}

void TradingAgent::skip(const std::string& reason) {
  const domain::Decision& decision = *cycle_->decision;
  std::cout << "[TradingAgent] skipping " << decision.id << ": " << reason
            << "\n";

  DecisionSkippedEvent ev;
  ev.asset_pair = decision.asset_pair;
  ev.decision_id = decision.id;
  ev.action = decision.action;
  ev.reason = reason;
  ev.cycle_id = cycle_->id;
  ev.timestamp = now();
  publish(ev);

  setOutcome(OutcomeKind::Skipped, reason);
  fire(AgentTrigger::TradeNotExecutable);
}

void TradingAgent::fireTradeApproved() {
  if (!cycle_ || !cycle_->decision || !cycle_->verdict ||
      !cycle_->verdict->approved()) {
    throw InvariantViolation("TradeApproved without an approved verdict");
  }
  if (cycle_->decision->action == domain::Action::Hold) {
    throw InvariantViolation("TradeApproved for a HOLD decision");
  }
  fire(AgentTrigger::TradeApproved);
}

// -----------------------------------------------------------------------------
// Execution
// -----------------------------------------------------------------------------
void TradingAgent::onExecution() {
  Cycle& cycle = *cycle_;
  if (!cycle.decision || !cycle.verdict || !cycle.verdict->approved()) {
    throw InvariantViolation("execution reached without an approved verdict");
  }
  const domain::Decision& decision = *cycle.decision;

  collectLateFills();
  ExecutionResult result = execution_.execute(decision, cycle.position_size,
                                               cycle.snapshot->price);
  cycle.outcome.reservation_id = result.reservation_id;

  if (result.filled()) {
    ++context_.daily_trade_count;
    daily_trades_.store(context_.daily_trade_count);

    TradeExecutedEvent ev;
    ev.asset_pair = decision.asset_pair;
    ev.decision_id = decision.id;
    ev.reservation_id = result.reservation_id;
    ev.trade_id = result.trade_id.value_or("");
    ev.action = decision.action;
    ev.size = result.filled_size;
    ev.fill_price = result.fill_price;
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);

    cycle.outcome.trade_id = ev.trade_id;
    setOutcome(OutcomeKind::Filled, "filled");
  } else {
    TradeFailedEvent ev;
    ev.asset_pair = decision.asset_pair;
    ev.decision_id = decision.id;
    ev.reservation_id = result.reservation_id;
    ev.error = result.error.value_or("unknown error");
    ev.cycle_id = cycle.id;
    ev.timestamp = now();
    publish(ev);

    setOutcome(OutcomeKind::Failed, ev.error);
  }

  collectLateFills();
  sweepReservations();
  fire(AgentTrigger::ExecutionFinished);
}

// -----------------------------------------------------------------------------
// Learning
// -----------------------------------------------------------------------------
void TradingAgent::onLearning() {
  ITradeMonitor& monitor = ports_.trade_monitor;
  auto drained = caller_.call(config_.venue_query_policy,
                              [&monitor] { return monitor.drainClosedTrades(); });

  if (drained.ok()) {
    for (const auto& trade : *drained.value) {
      try {
        ports_.memory.recordTradeOutcome(trade);
      } catch (const std::exception& e) {
        std::cerr << "[TradingAgent] WARNING: could not record trade "
                  << trade.trade_id << ": " << e.what() << "\n";
      }
    }
  } else {
    std::cerr << "[TradingAgent] WARNING: closed trades unavailable: "
              << drained.error << "\n";
  }

  endCycle(AgentTrigger::LearningFinished);
}

// -----------------------------------------------------------------------------
// Cycle bookkeeping
// -----------------------------------------------------------------------------
void TradingAgent::startCycle() {
  Cycle cycle;
  cycle.id = ++last_cycle_id_;
  cycle.started_at_ms = time_provider_.now_ms();
  cycle.outcome.cycle_id = cycle.id;
  cycle.outcome.started_at_ms = cycle.started_at_ms;
  cycle_ = std::move(cycle);
}

void TradingAgent::setOutcome(OutcomeKind kind, std::string reason) {
  cycle_->outcome.kind = kind;
  cycle_->outcome.reason = std::move(reason);
}

void TradingAgent::endCycle(AgentTrigger trigger) {
  fire(trigger);
  finishCycle();
}

void TradingAgent::finishCycle() {
  domain::CycleOutcome outcome = std::move(cycle_->outcome);
  outcome.ended_at_ms = time_provider_.now_ms();
  cycle_.reset();

  ++context_.cycles_completed;
  cycles_completed_.store(context_.cycles_completed);

  try {
    ports_.memory.recordCycleOutcome(outcome);
  } catch (const std::exception& e) {
    std::cerr << "[TradingAgent] WARNING: could not record cycle "
              << outcome.cycle_id << ": " << e.what() << "\n";
  }

  {
    std::lock_guard lock(status_mutex_);
    last_outcome_ = outcome;
  }

  std::cout << "[TradingAgent] cycle " << outcome.cycle_id << " "
            << outcome.asset_pair << ": " << domain::toString(outcome.kind)
            << (outcome.reason.empty() ? "" : " (" + outcome.reason + ")")
            << "\n";

  CycleCompletedEvent ev;
  ev.outcome = std::move(outcome);
  ev.timestamp = now();
  publish(ev);
}

void TradingAgent::fire(AgentTrigger trigger) {
  const AgentState from = state_.load();
  const AgentState to = nextState(from, trigger);
  state_.store(to);

  std::uint64_t cycle_id = 0;
  if (cycle_) {
    cycle_->outcome.path.push_back(to);
    cycle_id = cycle_->id;
  }

  StateTransitionEvent ev;
  ev.from = from;
  ev.to = to;
  ev.trigger = toString(trigger);
  ev.cycle_id = cycle_id;
  ev.timestamp = now();
  publish(ev);
}

void TradingAgent::sweepReservations() {
  auto swept = execution_.sweepStale();
  if (swept.empty()) {
    return;
  }
  ReservationsSweptEvent ev;
  ev.reservation_ids = std::move(swept);
  ev.timestamp = now();
  publish(ev);
}

void TradingAgent::collectLateFills() {
  for (auto& fill : execution_.collectLateFills()) {
    ++context_.daily_trade_count;
    daily_trades_.store(context_.daily_trade_count);

    TradeLateFilledEvent ev;
    ev.asset_pair = std::move(fill.asset_pair);
    ev.decision_id = std::move(fill.decision_id);
    ev.reservation_id = std::move(fill.reservation_id);
    ev.trade_id = std::move(fill.trade_id);
    ev.action = fill.action;
    ev.size = fill.size;
    ev.fill_price = fill.fill_price;
    ev.timestamp = now();
    publish(ev);
  }
}

void TradingAgent::publish(Event event) { bus_.publish(event); }

Timestamp TradingAgent::now() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

}  // namespace tradeloop
