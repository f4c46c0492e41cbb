#include "tradeloop/risk/rejection_cache.hpp"

#include <algorithm>

namespace tradeloop {

RejectionCache::RejectionCache(std::int64_t cooldown_ms)
    : cooldown_ms_(std::max<std::int64_t>(cooldown_ms, 0)) {}

std::string RejectionCache::key(const std::string& asset_pair,
                                domain::Action action) {
  return asset_pair + "|" + domain::toString(action);
}

domain::RejectionRecord RejectionCache::insert(const std::string& asset_pair,
                                               domain::Action action,
                                               domain::RejectionReason reason,
                                               std::int64_t now_ms) {
  domain::RejectionRecord record;
  record.asset_pair = asset_pair;
  record.action = action;
  record.reason = reason;
  record.rejected_at_ms = now_ms;
  record.expires_at_ms = now_ms + cooldown_ms_;

  // Time bucket in the fingerprint: one cooldown window per bucket.
  std::int64_t bucket = cooldown_ms_ > 0 ? now_ms / cooldown_ms_ : now_ms;
  record.fingerprint = key(asset_pair, action) + "|" + std::to_string(bucket);

  std::lock_guard lock(mutex_);
  purgeExpiredLocked(now_ms);
  records_[key(asset_pair, action)] = record;
  return record;
}

std::optional<domain::RejectionRecord> RejectionCache::active(
    const std::string& asset_pair, domain::Action action,
    std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(key(asset_pair, action));
  if (it == records_.end() || it->second.expires_at_ms <= now_ms) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t RejectionCache::purgeExpired(std::int64_t now_ms) {
  std::lock_guard lock(mutex_);
  return purgeExpiredLocked(now_ms);
}

std::size_t RejectionCache::purgeExpiredLocked(std::int64_t now_ms) {
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.expires_at_ms <= now_ms) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t RejectionCache::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

std::vector<domain::RejectionRecord> RejectionCache::entries() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::RejectionRecord> out;
  out.reserve(records_.size());
  for (const auto& [k, record] : records_) {
    out.push_back(record);
  }
  return out;
}

}  // namespace tradeloop
