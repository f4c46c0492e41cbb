#pragma once

#include "tradeloop/domain/market_snapshot.hpp"

#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IMarketDataSource — where Perception gets its MarketSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Narrow port onto market-data collection and enrichment.
//
// @details
// fetchSnapshot() returns the most recent snapshot the source has for the
// pair. It must not invent a fresher collected_at_ms than the data really
// has; the agent judges freshness from that field alone.
//
// Failure: throw (CollaboratorError or any std::exception). The call runs
// under BoundedCaller, so a hang is also tolerated.
//
// Thread model: Called from BoundedCaller workers. A timed-out call may
// still be running when the next one starts.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual domain::MarketSnapshot fetchSnapshot(
      const std::string& asset_pair) = 0;
};

}  // namespace tradeloop
