#include "tradeloop/engine/agent_runtime.hpp"
#include "tradeloop/domain/agent_state.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradeloop {

AgentRuntime::AgentRuntime(const AgentConfig& config, AgentPorts ports,
                           const ITimeProvider& time_provider,
                           AgentContext context)
    : config_(config), rejections_(config.risk.cooldown_ms) {
  agent_ = std::make_unique<TradingAgent>(config_, ports, bus_, ledger_,
                                          rejections_, time_provider,
                                          std::move(context));
  loop_ = std::make_unique<PeriodicLoopThread>([this] { return step(); },
                                               config_.analysis_interval);
}

AgentRuntime::~AgentRuntime() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AgentRuntime::start() {
  if (running_) {
    return;
  }

  // ---  1) IPC first, so telemetry covers recovery ---------------------------
  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.telemetry_endpoint);
    ipc_server_->start();

    IpcServer* server = ipc_server_.get();
    telemetry_bridge_ = ScopedSubscription(
        bus_, bus_.subscribe([server](const Event& e) {
          server->pushTelemetry(e);
        }));
  }

  // ---  2) Agent loop ---------------------------------------------------------
  loop_->start();

  running_ = true;
  std::cout << "[AgentRuntime] started. Threads: agent_loop"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void AgentRuntime::stop() {
  if (!running_) {
    return;
  }

  // ---  1) IPC server first: its command handler calls into the loop -------
  telemetry_bridge_.reset();
  ipc_server_.reset();

  // ---  2) Agent loop (waits for the tick in progress) -----------------------
  loop_->stop();

  running_ = false;
  std::cout << "[AgentRuntime] stopped. All threads joined.\n";
}

bool AgentRuntime::step() {
  try {
    const domain::AgentState state = agent_->tick();
    return !agent_->halted() && state != domain::AgentState::Idle;
  } catch (const std::exception& e) {
    std::cerr << "[AgentRuntime] tick failed: " << e.what() << "\n";
    agent_->halt(std::string("tick failed: ") + e.what());
    return false;
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands from the IPC REP socket
// -----------------------------------------------------------------------------
std::string AgentRuntime::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["state"] = domain::toString(agent_->state());
    response["halted"] = agent_->halted();
    response["halt_reason"] = agent_->haltReason();
    response["daily_trades"] = agent_->dailyTradeCount();
    response["cycles_completed"] = agent_->cyclesCompleted();
    response["held_reservations"] = ledger_.heldCount();
    response["cooldowns"] = rejections_.size();

    if (auto outcome = agent_->lastOutcome()) {
      response["last_outcome"] = {
          {"cycle_id", outcome->cycle_id},
          {"asset_pair", outcome->asset_pair},
          {"kind", domain::toString(outcome->kind)},
          {"reason", outcome->reason}};
    }
  } else if (cmd == "HALT") {
    agent_->halt("operator HALT command");
    response["status"] = "ok";
    response["response"] = "Agent halted";
  } else if (cmd == "TRIGGER") {
    if (agent_->halted()) {
      response["status"] = "error";
      response["response"] = "Agent is halted";
    } else if (!loop_->running()) {
      response["status"] = "error";
      response["response"] = "Agent loop is not running";
    } else {
      loop_->wake();
      response["status"] = "ok";
      response["response"] = "Cycle requested";
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace tradeloop
