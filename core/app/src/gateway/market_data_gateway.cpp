#include "tradeloop/gateway/market_data_gateway.hpp"
#include "tradeloop/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(const std::string& endpoint,
                                     SimulationTimeProvider* replay_clock)
    : replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

MarketDataGateway::~MarketDataGateway() { stop(); }

void MarketDataGateway::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void MarketDataGateway::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void MarketDataGateway::setSnapshotListener(SnapshotListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop on the gateway thread
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout, re-check running_
    }
    ingest(msg.to_string());
  }
}

bool MarketDataGateway::ingest(const std::string& payload) {
  domain::MarketSnapshot snapshot;
  try {
    snapshot = parseSnapshot(nlohmann::json::parse(payload));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }

  if (replay_clock_ != nullptr) {
    replay_clock_->advance_time(snapshot.collected_at_ms);
  }

  SnapshotListener listener;
  {
    std::lock_guard lock(mutex_);
    latest_[snapshot.asset_pair] = snapshot;
    listener = listener_;
  }
  if (listener) {
    listener(snapshot);
  }
  return true;
}

domain::MarketSnapshot MarketDataGateway::fetchSnapshot(
    const std::string& asset_pair) {
  std::lock_guard lock(mutex_);
  auto it = latest_.find(asset_pair);
  if (it == latest_.end()) {
    throw CollaboratorError("no market data received for " + asset_pair);
  }
  return it->second;
}

std::size_t MarketDataGateway::cachedPairs() const {
  std::lock_guard lock(mutex_);
  return latest_.size();
}

domain::MarketSnapshot MarketDataGateway::parseSnapshot(
    const nlohmann::json& json) {
  domain::MarketSnapshot s;
  s.asset_pair = json.at("asset_pair").get<std::string>();
  s.price = json.at("price").get<double>();
  s.collected_at_ms = json.at("timestamp_ms").get<std::int64_t>();
  s.rsi = json.value("rsi", 50.0);
  s.volatility = json.value("volatility", 0.0);
  s.trend = json.value("trend", 0.0);
  s.sentiment = json.value("sentiment", 0.0);
  if (json.contains("returns")) {
    s.recent_returns = json.at("returns").get<std::vector<double>>();
  }
  return s;
}

}  // namespace tradeloop
