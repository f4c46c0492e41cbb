#pragma once

#include "tradeloop/domain/decision.hpp"
#include "tradeloop/domain/rejection_record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// RejectionCache — cooldown memory of recent risk rejections
// -----------------------------------------------------------------------------
//
// @brief  Remembers rejected (asset pair, action) combinations until their
//         cooldown expires, so the gatekeeper rejects a repeat proposal with
//         cooldown_active instead of re-running the full check chain.
//
// @details
// One record per (asset pair, action). Inserting again replaces the record
// and restarts its cooldown. Expired records are invisible to active() and
// are physically removed by purgeExpired(), which insert() calls as well so
// the map does not grow without bound.
//
// Only RiskGatekeeper writes to the cache, and only on rejection. Approved
// decisions never create an entry.
//
// Thread model:
//   Shared mutable resource. Every method takes mutex_; safe from any
//   thread. The IPC STATUS command reads size() from the IPC thread.
//
// Ownership:
//   Owned by AgentRuntime (or the test), injected by reference into
//   RiskGatekeeper.
// -----------------------------------------------------------------------------
class RejectionCache {
 public:
  explicit RejectionCache(std::int64_t cooldown_ms);

  RejectionCache(const RejectionCache&) = delete;
  RejectionCache& operator=(const RejectionCache&) = delete;

  // -------------------------------------------------------------------------
  // insert(asset_pair, action, reason, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Records a rejection that expires at now_ms + cooldown_ms.
  // @return The stored record.
  // -------------------------------------------------------------------------
  domain::RejectionRecord insert(const std::string& asset_pair,
                                 domain::Action action,
                                 domain::RejectionReason reason,
                                 std::int64_t now_ms);

  // Unexpired record for (asset_pair, action), if any. A record whose
  // expires_at_ms equals now_ms has expired.
  std::optional<domain::RejectionRecord> active(const std::string& asset_pair,
                                                domain::Action action,
                                                std::int64_t now_ms) const;

  // Removes expired records. Returns how many were removed.
  std::size_t purgeExpired(std::int64_t now_ms);

  std::size_t size() const;

  std::vector<domain::RejectionRecord> entries() const;

  std::int64_t cooldownMs() const { return cooldown_ms_; }

 private:
  static std::string key(const std::string& asset_pair, domain::Action action);

  std::size_t purgeExpiredLocked(std::int64_t now_ms);

  const std::int64_t cooldown_ms_;
  mutable std::mutex mutex_;
  std::map<std::string, domain::RejectionRecord> records_;
};

}  // namespace tradeloop
