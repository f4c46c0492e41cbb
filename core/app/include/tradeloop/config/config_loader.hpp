#pragma once

#include "tradeloop/config/agent_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Reads AgentConfig from JSON and validates it.
//
// @details
// parseAgentConfig() starts from the defaults in AgentConfig and overrides
// every key present in the document. Unknown keys are ignored. A key with
// the wrong JSON type is a ConfigError, not a silent default.
//
// Percent-like values (kill_switch_loss_pct, risk.max_var_pct,
// risk.margin_safety_buffer_pct, execution.risk_per_trade,
// execution.default_stop_loss, execution.max_position_fraction) accept
// either a fraction (0.05) or a whole percentage (5); anything above 1 is
// divided by 100.
//
// Call policies ("market_data", "decision", "venue_query", "order",
// "recovery_fetch") share one layout:
//   { "timeout_ms": 5000, "max_attempts": 2, "backoff_ms": [500, 1000] }
// "order" only accepts max_attempts == 1 and "recovery_fetch" only
// max_attempts == 2; both values are fixed by the agent's safety rules.
//
// Errors: every failure is reported as ConfigError with the offending key.
// -----------------------------------------------------------------------------

AgentConfig parseAgentConfig(const nlohmann::json& document);

// Reads and parses a file; ConfigError if it cannot be opened or parsed.
AgentConfig loadAgentConfig(const std::string& path);

// Throws ConfigError on the first out-of-range value.
void validateAgentConfig(const AgentConfig& config);

// 5 -> 0.05, 0.05 -> 0.05
double normalizePercent(double value);

}  // namespace tradeloop
