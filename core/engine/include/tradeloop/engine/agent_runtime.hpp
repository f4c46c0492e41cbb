#pragma once

#include "tradeloop/concurrent/periodic_loop_thread.hpp"
#include "tradeloop/config/agent_config.hpp"
#include "tradeloop/engine/agent_context.hpp"
#include "tradeloop/engine/trading_agent.hpp"
#include "tradeloop/eventbus/event_bus.hpp"
#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/network/ipc_server.hpp"
#include "tradeloop/risk/rejection_cache.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// AgentRuntime
// -----------------------------------------------------------------------------
//
// @brief  Owns everything the agent needs besides its collaborators, drives
//         it on a worker thread, and exposes the operator command surface.
//
// @details
// main() and the integration tests build the collaborators, hand them in as
// AgentPorts, and use start() / stop() without wiring internals.
//
// Thread layout:
//
//   agent loop thread   → TradingAgent::tick() via PeriodicLoopThread. Ticks
//                         back-to-back through a cycle, then waits
//                         analysis_interval (or a TRIGGER) in Idle.
//   IPC thread          → IpcServer: telemetry PUB + command REP.
//   main thread         → start(), wait for shutdown, stop().
//
// Telemetry bridge: a bus subscription forwards every Event to the IPC
// server's queue, so serialization happens on the IPC thread.
//
// Commands (executeCommand(), JSON reply):
//   PING     → {"status":"ok","response":"PONG"}
//   STATUS   → state, halted, halt_reason, daily_trades, cycles_completed,
//              held_reservations, cooldowns, last_outcome
//   HALT     → halts the agent
//   TRIGGER  → ends the current idle wait so a cycle starts now
//
// Ownership:
//   AgentRuntime
//    ├── config_           (AgentConfig — value, immutable)
//    ├── bus_              (EventBus — value)
//    ├── ledger_           (ExposureLedger — value)
//    ├── rejections_       (RejectionCache — value)
//    ├── agent_            (unique_ptr<TradingAgent>)
//    ├── loop_             (unique_ptr<PeriodicLoopThread>)
//    ├── ipc_server_       (unique_ptr<IpcServer>, only with endpoints)
//    └── telemetry_bridge_ (ScopedSubscription on bus_)
//
// Members are declared so that the loop thread and IPC server are destroyed
// before the agent they call into, and the agent before the bus, ledger and
// cache it borrows.
// -----------------------------------------------------------------------------
class AgentRuntime {
 public:
  AgentRuntime(const AgentConfig& config, AgentPorts ports,
               const ITimeProvider& time_provider,
               AgentContext context = AgentContext{});

  // Calls stop().
  ~AgentRuntime();

  AgentRuntime(const AgentRuntime&) = delete;
  AgentRuntime& operator=(const AgentRuntime&) = delete;
  AgentRuntime(AgentRuntime&&) = delete;
  AgentRuntime& operator=(AgentRuntime&&) = delete;

  // Starts the IPC server (when both endpoints are configured) and the
  // agent loop. Idempotent.
  void start();

  // Joins the loop after its current tick, then the IPC server. Idempotent.
  void stop();

  bool running() const { return running_; }

  // -------------------------------------------------------------------------
  // step()
  // -------------------------------------------------------------------------
  // @brief  One loop iteration: ticks the agent once.
  //
  // @return true while a cycle is in progress (run again immediately);
  //         false in Idle or once halted.
  //
  // @details
  // An exception escaping tick() halts the agent (tick() already did so for
  // invariant violations) and is logged; it never reaches the loop thread.
  // -------------------------------------------------------------------------
  bool step();

  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  TradingAgent& agent() { return *agent_; }
  const ExposureLedger& ledger() const { return ledger_; }
  const RejectionCache& rejections() const { return rejections_; }

 private:
  const AgentConfig config_;
  EventBus bus_;
  ExposureLedger ledger_;
  RejectionCache rejections_;

  std::unique_ptr<TradingAgent> agent_;
  std::unique_ptr<IpcServer> ipc_server_;
  ScopedSubscription telemetry_bridge_;
  std::unique_ptr<PeriodicLoopThread> loop_;

  bool running_{false};
};

}  // namespace tradeloop
