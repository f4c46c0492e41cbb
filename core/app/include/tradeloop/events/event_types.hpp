#pragma once

#include "tradeloop/domain/agent_state.hpp"
#include "tradeloop/domain/cycle_outcome.hpp"
#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/position.hpp"
#include "tradeloop/domain/rejection_record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time carried by every event. Built from
// ITimeProvider::now_ms() via ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Lifecycle events
// -----------------------------------------------------------------------------
// Published by TradingAgent on its EventBus. Every event is plain data with
// value semantics so it can be queued to the IPC thread by copy.
//
// cycle_id identifies the decision cycle (0 for events outside any cycle,
// e.g. recovery). Events carry asset_pair / decision_id where they apply.
// -----------------------------------------------------------------------------

// Emitted on every state change, in order.
struct StateTransitionEvent {
  domain::AgentState from{domain::AgentState::Idle};
  domain::AgentState to{domain::AgentState::Idle};
  std::string trigger;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct RecoveryCompleteEvent {
  std::size_t positions_found{0};
  std::size_t actions_taken{0};
  bool degraded{false};
  std::vector<std::string> closed_position_ids;
  Timestamp timestamp{};
};

struct RecoveryFailedEvent {
  std::string error;
  std::size_t positions_found{0};
  std::size_t actions_taken{0};
  Timestamp timestamp{};
};

// Snapshot could not be fetched at all (after retries).
struct MarketDataUnavailableEvent {
  std::string asset_pair;
  std::string error;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct DataFreshnessFailedEvent {
  std::string asset_pair;
  std::int64_t collected_at_ms{0};
  std::int64_t age_ms{0};
  std::int64_t threshold_ms{0};
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct DecisionUnavailableEvent {
  std::string asset_pair;
  std::string reason;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

// Policy gate before risk checks (confidence, daily limit, approval, size).
struct DecisionSkippedEvent {
  std::string asset_pair;
  std::string decision_id;
  domain::Action action{domain::Action::Hold};
  std::string reason;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct RiskRejectedEvent {
  std::string asset_pair;
  std::string decision_id;
  domain::Action action{domain::Action::Hold};
  domain::RejectionReason reason{domain::RejectionReason::CooldownActive};
  std::string detail;
  std::map<std::string, double> telemetry;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct TradeExecutedEvent {
  std::string asset_pair;
  std::string decision_id;
  std::string reservation_id;
  std::string trade_id;
  domain::Action action{domain::Action::Buy};
  double size{0.0};
  double fill_price{0.0};
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

struct TradeFailedEvent {
  std::string asset_pair;
  std::string decision_id;
  std::string reservation_id;
  std::string error;
  std::uint64_t cycle_id{0};
  Timestamp timestamp{};
};

// An order reported as failed on timeout that the venue filled afterwards.
// Counts as a trade for the daily limit.
struct TradeLateFilledEvent {
  std::string asset_pair;
  std::string decision_id;
  std::string reservation_id;
  std::string trade_id;
  domain::Action action{domain::Action::Buy};
  double size{0.0};
  double fill_price{0.0};
  Timestamp timestamp{};
};

// Held reservations released by the age sweep.
struct ReservationsSweptEvent {
  std::vector<std::string> reservation_ids;
  Timestamp timestamp{};
};

struct AgentHaltedEvent {
  std::string reason;
  domain::AgentState state{domain::AgentState::Idle};
  Timestamp timestamp{};
};

struct CycleCompletedEvent {
  domain::CycleOutcome outcome;
  Timestamp timestamp{};
};

}  // namespace tradeloop
