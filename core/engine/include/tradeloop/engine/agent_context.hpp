#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// AgentContext — the loop's mutable state, held explicitly
// -----------------------------------------------------------------------------
//
// @brief  Everything the agent carries from one cycle to the next, in one
//         value owned by the TradingAgent.
//
// @details
// Fields:
//   - daily_trade_count:  committed trades since the start of trading_day.
//   - trading_day:        UTC day index (time_utils utc_day_index) the
//                         counter belongs to; -1 before the first cycle.
//   - next_pair_index:    round-robin cursor into the configured pairs.
//   - analysis_failures:  per pair, times (epoch ms) of recent decision
//                         provider failures.
//   - cycles_completed:   cycles that reached a CycleOutcome.
//
// Saved and loaded as JSON at loop boundaries, or after a halt (TradingAgent
// enforces that).
// -----------------------------------------------------------------------------
struct AgentContext {
  int daily_trade_count{0};
  std::int64_t trading_day{-1};
  std::size_t next_pair_index{0};
  std::map<std::string, std::vector<std::int64_t>> analysis_failures;
  std::uint64_t cycles_completed{0};

  // Resets the daily counter and failure history when `day` differs from
  // trading_day. Returns true if it did.
  bool rollDay(std::int64_t day);

  // Drops failures recorded at or before now_ms - decay_ms.
  void forgetFailuresBefore(std::int64_t now_ms, std::int64_t decay_ms);

  std::size_t failureCount(const std::string& asset_pair) const;

  void recordFailure(const std::string& asset_pair, std::int64_t now_ms);

  // A successful analysis wipes the pair's failure history.
  void clearFailures(const std::string& asset_pair);
};

void to_json(nlohmann::json& j, const AgentContext& context);
void from_json(const nlohmann::json& j, AgentContext& context);

// Returns std::nullopt when the file does not exist. Throws ConfigError if it
// exists but cannot be parsed.
std::optional<AgentContext> loadAgentContext(const std::string& path);

// Throws ConfigError if the file cannot be written.
void saveAgentContext(const std::string& path, const AgentContext& context);

}  // namespace tradeloop
