#pragma once

#include "tradeloop/domain/market_snapshot.hpp"
#include "tradeloop/ports/i_market_data_source.hpp"
#include "tradeloop/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace tradeloop {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ feed of market snapshots
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded snapshots, keeps
//         the latest one per asset pair, and serves them to the agent as an
//         IMarketDataSource.
//
// @details
// An external feed process (indicator pipeline, replay script) publishes
// one message per snapshot. The gateway's recv thread decodes each message
// and replaces the cached snapshot for its pair. fetchSnapshot() returns the
// cached value; the agent's freshness check decides whether it is still
// usable, so the gateway never filters on age itself.
//
// Expected JSON format:
//   {
//     "asset_pair":   "BTCUSD",
//     "price":        43250.5,
//     "timestamp_ms": 1700000000000,   // when the snapshot was collected
//     "rsi":          55.2,            // optional, default 50
//     "volatility":   0.012,           // optional
//     "trend":        0.004,           // optional
//     "sentiment":    0.1,             // optional, [-1, 1]
//     "returns":      [0.001, -0.002]  // optional, oldest first
//   }
//
// When constructed with a SimulationTimeProvider (replay mode) each message
// also advances the simulated clock to its timestamp_ms, BEFORE the cache
// is updated, as in a backtest.
//
// Thread model:
//   start() spawns the recv thread; stop() joins it. The SUB socket uses
//   ZMQ_RCVTIMEO so the thread notices stop() within kRecvTimeoutMs.
//   fetchSnapshot() and ingest() are safe from any thread (mutex_). The
//   snapshot listener runs on the recv thread, outside the lock.
//
// Ownership:
//   Owns the zmq::context_t, the SUB socket and the recv thread. Borrows
//   the optional simulation clock.
// -----------------------------------------------------------------------------
class MarketDataGateway final : public IMarketDataSource {
 public:
  using SnapshotListener = std::function<void(const domain::MarketSnapshot&)>;

  explicit MarketDataGateway(const std::string& endpoint,
                             SimulationTimeProvider* replay_clock = nullptr);

  ~MarketDataGateway() override;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Idempotent.
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // fetchSnapshot(asset_pair)
  // -------------------------------------------------------------------------
  // @return The latest snapshot received for asset_pair.
  // @throws CollaboratorError if nothing has been received for it yet.
  // -------------------------------------------------------------------------
  domain::MarketSnapshot fetchSnapshot(const std::string& asset_pair) override;

  // Decodes one message payload and updates the cache. Returns false (and
  // logs) for malformed payloads. Used by the recv thread.
  bool ingest(const std::string& payload);

  // Called for every decoded snapshot (main wires it to the paper venue's
  // mark prices). Set before start().
  void setSnapshotListener(SnapshotListener listener);

  std::size_t cachedPairs() const;

  // @throws nlohmann::json::exception on missing or mistyped fields.
  static domain::MarketSnapshot parseSnapshot(const nlohmann::json& json);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  SimulationTimeProvider* replay_clock_;
  SnapshotListener listener_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  mutable std::mutex mutex_;
  std::map<std::string, domain::MarketSnapshot> latest_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeloop
