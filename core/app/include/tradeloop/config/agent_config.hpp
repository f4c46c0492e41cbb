#pragma once

#include "tradeloop/domain/retry_policy.hpp"
#include "tradeloop/domain/risk_limits.hpp"
#include "tradeloop/execution/execution_stage.hpp"
#include "tradeloop/recovery/recovery_manager.hpp"
#include "tradeloop/risk/position_sizer.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tradeloop {

// Empty endpoint = that socket is not opened.
struct IpcSettings {
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5557"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5556"};
};

// Starting balance of the paper venue used by the agent executable.
struct PaperSettings {
  double initial_equity{10000.0};
  std::string currency{"USD"};
};

// -----------------------------------------------------------------------------
// AgentConfig — everything the agent executable reads from its JSON file
// -----------------------------------------------------------------------------
//
// Defaults are usable as-is; a config file only overrides what it names.
// See config/agent.json for the on-disk layout.
// -----------------------------------------------------------------------------
struct AgentConfig {
  std::vector<std::string> asset_pairs{"BTCUSD"};
  std::chrono::milliseconds analysis_interval{60000};

  // Policy gate applied before the RiskGatekeeper.
  double min_confidence{0.6};
  int max_daily_trades{5};  // 0: no daily limit
  bool autonomous_execution{true};

  // Unrealized loss (fraction of equity) that halts the agent.
  double kill_switch_loss_pct{0.10};

  // A pair with this many recent provider failures is skipped until the
  // failures are older than analysis_failure_decay_ms.
  int max_analysis_failures{3};
  std::int64_t analysis_failure_decay_ms{60 * 60 * 1000};

  domain::RiskLimits risk;
  ExecutionSettings execution;
  SizingSettings sizing;
  RecoverySettings recovery;

  domain::RetryPolicy market_data_policy;
  domain::RetryPolicy decision_policy;
  domain::RetryPolicy venue_query_policy;

  IpcSettings ipc;
  PaperSettings paper;

  // Where AgentContext is saved on shutdown and loaded on startup.
  // Empty disables persistence.
  std::string context_path{"agent_context.json"};

  AgentConfig() {
    market_data_policy.max_attempts = 2;
    market_data_policy.timeout = std::chrono::milliseconds{5000};
    market_data_policy.backoff = {std::chrono::milliseconds{500}};

    decision_policy.max_attempts = 2;
    decision_policy.timeout = std::chrono::milliseconds{30000};
    decision_policy.backoff = {std::chrono::milliseconds{1000}};

    venue_query_policy.max_attempts = 2;
    venue_query_policy.timeout = std::chrono::milliseconds{5000};
    venue_query_policy.backoff = {std::chrono::milliseconds{500}};
  }
};

}  // namespace tradeloop
