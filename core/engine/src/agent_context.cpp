#include "tradeloop/engine/agent_context.hpp"
#include "tradeloop/domain/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace tradeloop {

bool AgentContext::rollDay(std::int64_t day) {
  if (day == trading_day) {
    return false;
  }
  trading_day = day;
  daily_trade_count = 0;
  analysis_failures.clear();
  return true;
}

void AgentContext::forgetFailuresBefore(std::int64_t now_ms,
                                        std::int64_t decay_ms) {
  const std::int64_t cutoff = now_ms - decay_ms;
  for (auto it = analysis_failures.begin(); it != analysis_failures.end();) {
    auto& times = it->second;
    times.erase(std::remove_if(times.begin(), times.end(),
                               [cutoff](std::int64_t t) { return t <= cutoff; }),
                times.end());
    if (times.empty()) {
      it = analysis_failures.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t AgentContext::failureCount(const std::string& asset_pair) const {
  auto it = analysis_failures.find(asset_pair);
  return it == analysis_failures.end() ? 0 : it->second.size();
}

void AgentContext::recordFailure(const std::string& asset_pair,
                                 std::int64_t now_ms) {
  analysis_failures[asset_pair].push_back(now_ms);
}

void AgentContext::clearFailures(const std::string& asset_pair) {
  analysis_failures.erase(asset_pair);
}

void to_json(nlohmann::json& j, const AgentContext& c) {
  j = nlohmann::json{{"daily_trade_count", c.daily_trade_count},
                     {"trading_day", c.trading_day},
                     {"next_pair_index", c.next_pair_index},
                     {"analysis_failures", c.analysis_failures},
                     {"cycles_completed", c.cycles_completed}};
}

void from_json(const nlohmann::json& j, AgentContext& c) {
  AgentContext out;
  out.daily_trade_count = j.value("daily_trade_count", 0);
  out.trading_day = j.value("trading_day", std::int64_t{-1});
  out.next_pair_index = j.value("next_pair_index", std::size_t{0});
  out.cycles_completed = j.value("cycles_completed", std::uint64_t{0});
  if (j.contains("analysis_failures")) {
    j.at("analysis_failures").get_to(out.analysis_failures);
  }
  c = std::move(out);
}

std::optional<AgentContext> loadAgentContext(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  try {
    nlohmann::json j;
    in >> j;
    auto context = j.get<AgentContext>();
    std::cout << "[AgentContext] loaded " << path << " (day "
              << context.trading_day << ", " << context.daily_trade_count
              << " trades)\n";
    return context;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("cannot parse agent context " + path + ": " + e.what());
  }
}

void saveAgentContext(const std::string& path, const AgentContext& context) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw ConfigError("cannot write agent context " + path);
  }
  out << nlohmann::json(context).dump(2) << "\n";
  if (!out) {
    throw ConfigError("failed writing agent context " + path);
  }
  std::cout << "[AgentContext] saved " << path << "\n";
}

}  // namespace tradeloop
