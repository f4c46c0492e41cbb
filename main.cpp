// -----------------------------------------------------------------------------
// tradeloop_agent — single executable entry point.
//
// Paper trading mode:
//   1) Load the agent configuration (JSON) and the saved AgentContext.
//   2) Build the collaborators: MarketDataGateway (ZeroMQ snapshot feed),
//      DummyDecisionProvider, MockTradingVenue, TradeJournal.
//   3) Create the AgentRuntime and start it. The agent recovers against the
//      venue, then runs one decision cycle per analysis interval.
//   4) Wait for Ctrl-C, stop the runtime, save the AgentContext.
//
// Thread layout:
//   main thread        → setup, then waits for SIGINT
//   agent loop thread  → TradingAgent::tick() (AgentRuntime)
//   ipc thread         → telemetry PUB + command REP (AgentRuntime)
//   market data thread → MarketDataGateway recv loop
//
// Usage: tradeloop_agent [config.json]   (default: config/agent.json)
// -----------------------------------------------------------------------------

#include "tradeloop/config/config_loader.hpp"
#include "tradeloop/domain/errors.hpp"
#include "tradeloop/engine/agent_context.hpp"
#include "tradeloop/engine/agent_runtime.hpp"
#include "tradeloop/events/event_types.hpp"
#include "tradeloop/execution/mock_trading_venue.hpp"
#include "tradeloop/gateway/market_data_gateway.hpp"
#include "tradeloop/monitor/trade_journal.hpp"
#include "tradeloop/strategy/dummy_decision_provider.hpp"
#include "tradeloop/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. A lock-free atomic store is
// async-signal-safe; main() polls it.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/agent.json";

  // -------------------------------------------------------------------------
  // 1) Configuration and saved context.
  // -------------------------------------------------------------------------
  tradeloop::AgentConfig config;
  tradeloop::AgentContext context;
  try {
    config = tradeloop::loadAgentConfig(config_path);
    if (!config.context_path.empty()) {
      if (auto saved = tradeloop::loadAgentContext(config.context_path)) {
        context = *saved;
      }
    }
  } catch (const tradeloop::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators. All are stack-local and outlive the runtime.
  // -------------------------------------------------------------------------
  tradeloop::LiveTimeProvider clock;

  tradeloop::TradeJournal journal;

  tradeloop::domain::Balance initial;
  initial.equity = config.paper.initial_equity;
  initial.free_margin = config.paper.initial_equity;
  initial.currency = config.paper.currency;
  tradeloop::MockTradingVenue venue(clock, initial);
  venue.setCloseListener([&journal](const tradeloop::domain::ClosedTrade& t) {
    journal.reportClosed(t);
  });

  tradeloop::MarketDataGateway gateway(config.ipc.market_data_endpoint);
  gateway.setSnapshotListener(
      [&venue](const tradeloop::domain::MarketSnapshot& s) {
        venue.updateMark(s.asset_pair, s.price);
      });

  tradeloop::DummyDecisionProvider provider;

  tradeloop::AgentPorts ports{gateway, provider, venue, journal, journal};

  // -------------------------------------------------------------------------
  // 3) Runtime. Console subscribers are attached before start() so recovery
  //    events are visible.
  // -------------------------------------------------------------------------
  tradeloop::AgentRuntime runtime(config, ports, clock, context);

  runtime.eventBus().subscribe<tradeloop::RiskRejectedEvent>(
      [](const tradeloop::RiskRejectedEvent& e) {
        std::cout << "[Risk] REJECTED " << e.asset_pair << " "
                  << tradeloop::domain::toString(e.action) << ": "
                  << tradeloop::domain::toString(e.reason) << " (" << e.detail
                  << ")\n";
      });
  runtime.eventBus().subscribe<tradeloop::TradeExecutedEvent>(
      [](const tradeloop::TradeExecutedEvent& e) {
        std::cout << "[Trade] EXECUTED " << e.asset_pair << " "
                  << tradeloop::domain::toString(e.action) << " " << e.size
                  << " @ " << e.fill_price << " trade=" << e.trade_id << "\n";
      });
  runtime.eventBus().subscribe<tradeloop::AgentHaltedEvent>(
      [](const tradeloop::AgentHaltedEvent& e) {
        std::cout << "[Agent] HALTED: " << e.reason << "\n";
      });

  std::signal(SIGINT, sigint_handler);

  try {
    gateway.start();
    runtime.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Listening for snapshots on "
            << config.ipc.market_data_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  runtime.stop();
  gateway.stop();

  if (!config.context_path.empty()) {
    // The loop may have stopped between two stages of a cycle. Halting makes
    // the context final so it can still be exported.
    tradeloop::TradingAgent& agent = runtime.agent();
    const auto state = agent.state();
    if (state != tradeloop::domain::AgentState::Idle &&
        state != tradeloop::domain::AgentState::Recovering) {
      agent.halt("shutdown during " +
                 std::string(tradeloop::domain::toString(state)));
    }
    try {
      tradeloop::saveAgentContext(config.context_path, agent.exportContext());
    } catch (const std::exception& e) {
      std::cerr << "[main] agent context not saved: " << e.what() << "\n";
    }
  }

  std::cout << "[main] realized P&L " << journal.realizedPnl() << " over "
            << journal.trades().size() << " closed trades\n";
  return 0;
}
