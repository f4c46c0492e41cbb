#include "tradeloop/events/event_json.hpp"
#include "tradeloop/time/time_utils.hpp"

namespace tradeloop {

namespace {

nlohmann::json outcomeToJson(const domain::CycleOutcome& o) {
  nlohmann::json path = nlohmann::json::array();
  for (auto state : o.path) {
    path.push_back(domain::toString(state));
  }

  nlohmann::json j;
  j["cycle_id"] = o.cycle_id;
  j["asset_pair"] = o.asset_pair;
  j["decision_id"] = o.decision_id;
  j["outcome"] = domain::toString(o.kind);
  j["reason"] = o.reason;
  j["reservation_id"] = o.reservation_id;
  j["trade_id"] = o.trade_id;
  j["started_at_ms"] = o.started_at_ms;
  j["ended_at_ms"] = o.ended_at_ms;
  j["path"] = std::move(path);
  return j;
}

// -----------------------------------------------------------------------------
// JsonVisitor
// -----------------------------------------------------------------------------
// One overload per Event alternative. std::visit refuses to compile when an
// alternative has no overload, so a new event kind cannot be forgotten here.
// -----------------------------------------------------------------------------
struct JsonVisitor {
  nlohmann::json operator()(const StateTransitionEvent& e) const {
    nlohmann::json j;
    j["type"] = "state_transition";
    j["from"] = domain::toString(e.from);
    j["to"] = domain::toString(e.to);
    j["trigger"] = e.trigger;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const RecoveryCompleteEvent& e) const {
    nlohmann::json j;
    j["type"] = "recovery_complete";
    j["positions_found"] = e.positions_found;
    j["actions_taken"] = e.actions_taken;
    j["degraded"] = e.degraded;
    j["closed_position_ids"] = e.closed_position_ids;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const RecoveryFailedEvent& e) const {
    nlohmann::json j;
    j["type"] = "recovery_failed";
    j["error"] = e.error;
    j["positions_found"] = e.positions_found;
    j["actions_taken"] = e.actions_taken;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const MarketDataUnavailableEvent& e) const {
    nlohmann::json j;
    j["type"] = "market_data_unavailable";
    j["asset_pair"] = e.asset_pair;
    j["error"] = e.error;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const DataFreshnessFailedEvent& e) const {
    nlohmann::json j;
    j["type"] = "data_freshness_failed";
    j["asset_pair"] = e.asset_pair;
    j["collected_at_ms"] = e.collected_at_ms;
    j["age_ms"] = e.age_ms;
    j["threshold_ms"] = e.threshold_ms;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const DecisionUnavailableEvent& e) const {
    nlohmann::json j;
    j["type"] = "decision_unavailable";
    j["asset_pair"] = e.asset_pair;
    j["reason"] = e.reason;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const DecisionSkippedEvent& e) const {
    nlohmann::json j;
    j["type"] = "decision_skipped";
    j["asset_pair"] = e.asset_pair;
    j["decision_id"] = e.decision_id;
    j["action"] = domain::toString(e.action);
    j["reason"] = e.reason;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const RiskRejectedEvent& e) const {
    nlohmann::json j;
    j["type"] = "risk_rejected";
    j["asset_pair"] = e.asset_pair;
    j["decision_id"] = e.decision_id;
    j["action"] = domain::toString(e.action);
    j["reason"] = domain::toString(e.reason);
    j["detail"] = e.detail;
    j["telemetry"] = e.telemetry;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const TradeExecutedEvent& e) const {
    nlohmann::json j;
    j["type"] = "trade_executed";
    j["asset_pair"] = e.asset_pair;
    j["decision_id"] = e.decision_id;
    j["reservation_id"] = e.reservation_id;
    j["trade_id"] = e.trade_id;
    j["action"] = domain::toString(e.action);
    j["size"] = e.size;
    j["fill_price"] = e.fill_price;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const TradeFailedEvent& e) const {
    nlohmann::json j;
    j["type"] = "trade_failed";
    j["asset_pair"] = e.asset_pair;
    j["decision_id"] = e.decision_id;
    j["reservation_id"] = e.reservation_id;
    j["error"] = e.error;
    j["cycle_id"] = e.cycle_id;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const TradeLateFilledEvent& e) const {
    nlohmann::json j;
    j["type"] = "trade_late_filled";
    j["asset_pair"] = e.asset_pair;
    j["decision_id"] = e.decision_id;
    j["reservation_id"] = e.reservation_id;
    j["trade_id"] = e.trade_id;
    j["action"] = domain::toString(e.action);
    j["size"] = e.size;
    j["fill_price"] = e.fill_price;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const ReservationsSweptEvent& e) const {
    nlohmann::json j;
    j["type"] = "reservations_swept";
    j["reservation_ids"] = e.reservation_ids;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const AgentHaltedEvent& e) const {
    nlohmann::json j;
    j["type"] = "agent_halted";
    j["reason"] = e.reason;
    j["state"] = domain::toString(e.state);
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  nlohmann::json operator()(const CycleCompletedEvent& e) const {
    nlohmann::json j = outcomeToJson(e.outcome);
    j["type"] = "cycle_completed";
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }
};

}  // namespace

nlohmann::json toJson(const Event& event) {
  return std::visit(JsonVisitor{}, event);
}

const char* eventTypeName(const Event& event) {
  static constexpr const char* kNames[] = {
      "state_transition",       "recovery_complete",
      "recovery_failed",        "market_data_unavailable",
      "data_freshness_failed",  "decision_unavailable",
      "decision_skipped",       "risk_rejected",
      "trade_executed",         "trade_failed",
      "trade_late_filled",      "reservations_swept",
      "agent_halted",           "cycle_completed"};
  static_assert(sizeof(kNames) / sizeof(kNames[0]) ==
                    std::variant_size_v<Event>,
                "every Event alternative needs a type name");
  return kNames[event.index()];
}

}  // namespace tradeloop
