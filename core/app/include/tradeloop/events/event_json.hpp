#pragma once

#include "tradeloop/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Event → JSON
// -----------------------------------------------------------------------------
//
// @brief  Wire form of lifecycle events for the telemetry PUB socket and for
//         log lines.
//
// @details
// Every object has a "type" field with the snake_case event name
// ("risk_rejected", "trade_failed", ...) and a "timestamp_ms" field. The
// remaining fields mirror the event struct.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Event& event);

// Name used in the "type" field, e.g. "data_freshness_failed".
const char* eventTypeName(const Event& event);

}  // namespace tradeloop
