#include "tradeloop/config/config_loader.hpp"
#include "tradeloop/domain/errors.hpp"

#include <fstream>
#include <iostream>

namespace tradeloop {

namespace {

using nlohmann::json;

const json* section(const json& parent, const char* key) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config key '") + key +
                      "' must be an object");
  }
  return &*it;
}

// Overrides `out` with parent[key] when present. Type mismatches become
// ConfigError naming the key.
template <typename T>
void read(const json& parent, const char* key, T& out) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + key +
                      "' has the wrong type: " + e.what());
  }
}

void readMillis(const json& parent, const char* key,
                std::chrono::milliseconds& out) {
  std::int64_t ms = out.count();
  read(parent, key, ms);
  out = std::chrono::milliseconds{ms};
}

void readPercent(const json& parent, const char* key, double& out) {
  double value = out;
  read(parent, key, value);
  out = normalizePercent(value);
}

void readPolicy(const json& root, const char* key, domain::RetryPolicy& out) {
  const json* s = section(root, key);
  if (s == nullptr) {
    return;
  }
  read(*s, "max_attempts", out.max_attempts);
  readMillis(*s, "timeout_ms", out.timeout);

  std::vector<std::int64_t> backoff;
  read(*s, "backoff_ms", backoff);
  if (s->contains("backoff_ms")) {
    out.backoff.clear();
    for (auto ms : backoff) {
      out.backoff.emplace_back(ms);
    }
  }
}

void requireThat(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigError("invalid config: " + message);
  }
}

void validatePolicy(const domain::RetryPolicy& p, const std::string& name) {
  requireThat(p.max_attempts >= 1, name + ".max_attempts must be >= 1");
  requireThat(p.timeout.count() > 0, name + ".timeout_ms must be > 0");
  for (const auto& b : p.backoff) {
    requireThat(b.count() >= 0, name + ".backoff_ms entries must be >= 0");
  }
}

bool isFraction(double v) { return v >= 0.0 && v <= 1.0; }

}  // namespace

double normalizePercent(double value) {
  return value > 1.0 ? value / 100.0 : value;
}

// -----------------------------------------------------------------------------
// parseAgentConfig()
// -----------------------------------------------------------------------------
AgentConfig parseAgentConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  AgentConfig c;

  read(document, "asset_pairs", c.asset_pairs);
  readMillis(document, "analysis_interval_ms", c.analysis_interval);
  read(document, "min_confidence", c.min_confidence);
  read(document, "max_daily_trades", c.max_daily_trades);
  read(document, "autonomous_execution", c.autonomous_execution);
  readPercent(document, "kill_switch_loss_pct", c.kill_switch_loss_pct);
  read(document, "max_analysis_failures", c.max_analysis_failures);
  read(document, "analysis_failure_decay_ms", c.analysis_failure_decay_ms);
  read(document, "context_path", c.context_path);

  if (const json* risk = section(document, "risk")) {
    read(*risk, "max_data_age_ms", c.risk.max_data_age_ms);
    read(*risk, "correlation_threshold", c.risk.correlation_threshold);
    read(*risk, "max_correlated_assets", c.risk.max_correlated_assets);
    read(*risk, "min_correlation_samples", c.risk.min_correlation_samples);
    readPercent(*risk, "max_var_pct", c.risk.max_var_pct);
    read(*risk, "var_confidence", c.risk.var_confidence);
    read(*risk, "min_var_samples", c.risk.min_var_samples);
    readPercent(*risk, "var_fallback_loss_pct", c.risk.var_fallback_loss_pct);
    readPercent(*risk, "margin_safety_buffer_pct",
                c.risk.margin_safety_buffer_pct);
    read(*risk, "max_leverage", c.risk.max_leverage);
    read(*risk, "cooldown_ms", c.risk.cooldown_ms);
    read(*risk, "max_volatility", c.risk.max_volatility);
    read(*risk, "min_confidence_in_volatility",
         c.risk.min_confidence_in_volatility);
  }
  c.execution.max_leverage = c.risk.max_leverage;

  if (const json* exec = section(document, "execution")) {
    read(*exec, "max_reservation_age_ms", c.execution.max_reservation_age_ms);
    readPercent(*exec, "risk_per_trade", c.sizing.risk_per_trade);
    readPercent(*exec, "default_stop_loss", c.sizing.default_stop_loss);
    readPercent(*exec, "max_position_fraction",
                c.sizing.max_position_fraction);
  }

  if (const json* rec = section(document, "recovery")) {
    read(*rec, "enabled", c.recovery.enabled);
    read(*rec, "max_concurrent_trades", c.recovery.max_concurrent_trades);
  }

  readPolicy(document, "market_data", c.market_data_policy);
  readPolicy(document, "decision", c.decision_policy);
  readPolicy(document, "venue_query", c.venue_query_policy);

  // Order and recovery fetch have fixed attempt counts; the file may only
  // restate them.
  domain::RetryPolicy order = domain::RetryPolicy::once(c.execution.order_timeout);
  readPolicy(document, "order", order);
  requireThat(order.max_attempts == 1,
              "order.max_attempts must be 1 (orders are never retried)");
  c.execution.order_timeout = order.timeout;

  domain::RetryPolicy fetch;
  fetch.max_attempts = 2;
  fetch.timeout = c.recovery.fetch_timeout;
  fetch.backoff = {c.recovery.fetch_backoff};
  readPolicy(document, "recovery_fetch", fetch);
  requireThat(fetch.max_attempts == 2,
              "recovery_fetch.max_attempts must be 2 (exactly one retry)");
  c.recovery.fetch_timeout = fetch.timeout;
  if (!fetch.backoff.empty()) {
    c.recovery.fetch_backoff = fetch.backoff.front();
  }

  if (const json* ipc = section(document, "ipc")) {
    read(*ipc, "market_data_endpoint", c.ipc.market_data_endpoint);
    read(*ipc, "command_endpoint", c.ipc.command_endpoint);
    read(*ipc, "telemetry_endpoint", c.ipc.telemetry_endpoint);
  }

  if (const json* paper = section(document, "paper")) {
    read(*paper, "initial_equity", c.paper.initial_equity);
    read(*paper, "currency", c.paper.currency);
  }

  validateAgentConfig(c);
  return c;
}

AgentConfig loadAgentConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("cannot parse config file " + path + ": " + e.what());
  }

  AgentConfig config = parseAgentConfig(document);
  std::cout << "[ConfigLoader] loaded " << path << " ("
            << config.asset_pairs.size() << " asset pairs)\n";
  return config;
}

// -----------------------------------------------------------------------------
// validateAgentConfig()
// -----------------------------------------------------------------------------
void validateAgentConfig(const AgentConfig& c) {
  requireThat(!c.asset_pairs.empty(), "asset_pairs must not be empty");
  for (const auto& pair : c.asset_pairs) {
    requireThat(!pair.empty(), "asset_pairs entries must not be empty");
  }
  requireThat(c.analysis_interval.count() > 0,
              "analysis_interval_ms must be > 0");
  requireThat(isFraction(c.min_confidence),
              "min_confidence must be within [0, 1]");
  requireThat(c.max_daily_trades >= 0, "max_daily_trades must be >= 0");
  requireThat(c.kill_switch_loss_pct > 0.0 && c.kill_switch_loss_pct <= 1.0,
              "kill_switch_loss_pct must be within (0, 1]");
  requireThat(c.max_analysis_failures >= 1,
              "max_analysis_failures must be >= 1");
  requireThat(c.analysis_failure_decay_ms > 0,
              "analysis_failure_decay_ms must be > 0");

  const auto& r = c.risk;
  requireThat(r.max_data_age_ms > 0, "risk.max_data_age_ms must be > 0");
  requireThat(isFraction(r.correlation_threshold),
              "risk.correlation_threshold must be within [0, 1]");
  requireThat(r.max_correlated_assets >= 1,
              "risk.max_correlated_assets must be >= 1");
  requireThat(r.min_correlation_samples >= 2,
              "risk.min_correlation_samples must be >= 2");
  requireThat(r.max_var_pct > 0.0 && r.max_var_pct <= 1.0,
              "risk.max_var_pct must be within (0, 1]");
  requireThat(r.var_confidence >= 0.5 && r.var_confidence < 1.0,
              "risk.var_confidence must be within [0.5, 1)");
  requireThat(r.min_var_samples >= 2, "risk.min_var_samples must be >= 2");
  requireThat(isFraction(r.margin_safety_buffer_pct),
              "risk.margin_safety_buffer_pct must be within [0, 1]");
  requireThat(r.max_leverage > 0.0, "risk.max_leverage must be > 0");
  requireThat(r.cooldown_ms >= 0, "risk.cooldown_ms must be >= 0");
  requireThat(r.var_fallback_loss_pct > 0.0 && r.var_fallback_loss_pct <= 1.0,
              "risk.var_fallback_loss_pct must be within (0, 1]");
  requireThat(r.max_volatility >= 0.0, "risk.max_volatility must be >= 0");
  requireThat(isFraction(r.min_confidence_in_volatility),
              "risk.min_confidence_in_volatility must be within [0, 1]");

  requireThat(c.sizing.risk_per_trade > 0.0 && c.sizing.risk_per_trade <= 1.0,
              "execution.risk_per_trade must be within (0, 1]");
  requireThat(
      c.sizing.default_stop_loss > 0.0 && c.sizing.default_stop_loss <= 1.0,
      "execution.default_stop_loss must be within (0, 1]");
  requireThat(c.sizing.max_position_fraction > 0.0,
              "execution.max_position_fraction must be > 0");

  requireThat(c.execution.order_timeout.count() > 0,
              "order.timeout_ms must be > 0");
  requireThat(c.execution.max_reservation_age_ms >
                  c.execution.order_timeout.count(),
              "execution.max_reservation_age_ms must exceed order.timeout_ms");

  requireThat(c.recovery.max_concurrent_trades >= 1,
              "recovery.max_concurrent_trades must be >= 1");
  requireThat(c.recovery.fetch_timeout.count() > 0,
              "recovery_fetch.timeout_ms must be > 0");

  validatePolicy(c.market_data_policy, "market_data");
  validatePolicy(c.decision_policy, "decision");
  validatePolicy(c.venue_query_policy, "venue_query");

  requireThat(c.paper.initial_equity > 0.0,
              "paper.initial_equity must be > 0");
}

}  // namespace tradeloop
