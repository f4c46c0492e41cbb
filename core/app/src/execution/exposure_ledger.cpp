#include "tradeloop/execution/exposure_ledger.hpp"
#include "tradeloop/domain/errors.hpp"

#include <algorithm>
#include <iostream>

namespace tradeloop {

ExposureLedger::ExposureLedger(std::size_t history_capacity)
    : history_capacity_(std::max<std::size_t>(history_capacity, 1)) {}

// -----------------------------------------------------------------------------
// isValidTransition(): Held is the only non-terminal status
// -----------------------------------------------------------------------------
bool ExposureLedger::isValidTransition(domain::ReservationStatus from,
                                       domain::ReservationStatus to) {
  using S = domain::ReservationStatus;
  switch (from) {
    case S::Held:
      return to == S::Committed || to == S::Released;
    case S::Committed:
    case S::Released:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// reserve()
// -----------------------------------------------------------------------------
std::string ExposureLedger::reserve(const std::string& decision_id,
                                    const std::string& asset_pair,
                                    double notional, double margin,
                                    std::int64_t now_ms) {
  if (notional < 0.0 || margin < 0.0) {
    throw InvariantViolation("negative reservation for " + asset_pair);
  }

  std::lock_guard lock(mutex_);

  for (const auto& [id, r] : held_) {
    if (r.asset_pair == asset_pair) {
      throw InvariantViolation("asset pair " + asset_pair +
                               " already has held reservation " + id +
                               " (decision " + r.decision_id + ")");
    }
  }

  domain::ExposureReservation r;
  r.id = ids_.next();
  r.decision_id = decision_id;
  r.asset_pair = asset_pair;
  r.notional = notional;
  r.margin = margin;
  r.status = domain::ReservationStatus::Held;
  r.created_at_ms = now_ms;

  std::string id = r.id;
  held_.emplace(id, std::move(r));

  std::cout << "[ExposureLedger] HELD " << id << " pair=" << asset_pair
            << " notional=" << notional << " margin=" << margin << "\n";
  return id;
}

// -----------------------------------------------------------------------------
// commit()
// -----------------------------------------------------------------------------
void ExposureLedger::commit(const std::string& reservation_id,
                            std::int64_t now_ms) {
  std::lock_guard lock(mutex_);

  auto it = held_.find(reservation_id);
  if (it == held_.end()) {
    throw InvariantViolation("commit of reservation " + reservation_id +
                             " which is not held");
  }

  resolveLocked(it, domain::ReservationStatus::Committed, "", now_ms);
  std::cout << "[ExposureLedger] COMMITTED " << reservation_id << "\n";
}

// -----------------------------------------------------------------------------
// release()
// -----------------------------------------------------------------------------
bool ExposureLedger::release(const std::string& reservation_id,
                             const std::string& reason, std::int64_t now_ms) {
  std::lock_guard lock(mutex_);

  auto it = held_.find(reservation_id);
  if (it == held_.end()) {
    std::cerr << "[ExposureLedger] release of " << reservation_id
              << " ignored: not held (" << reason << ")\n";
    return false;
  }

  resolveLocked(it, domain::ReservationStatus::Released, reason, now_ms);
  std::cout << "[ExposureLedger] RELEASED " << reservation_id
            << " reason=" << reason << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// sweepStale()
// -----------------------------------------------------------------------------
std::vector<std::string> ExposureLedger::sweepStale(std::int64_t now_ms,
                                                    std::int64_t max_age_ms) {
  std::lock_guard lock(mutex_);

  std::vector<std::map<std::string, domain::ExposureReservation>::iterator>
      stale;
  for (auto it = held_.begin(); it != held_.end(); ++it) {
    if (now_ms - it->second.created_at_ms > max_age_ms) {
      stale.push_back(it);
    }
  }
  std::sort(stale.begin(), stale.end(), [](const auto& a, const auto& b) {
    return a->second.created_at_ms < b->second.created_at_ms;
  });

  std::vector<std::string> released;
  released.reserve(stale.size());
  for (auto it : stale) {
    std::cerr << "[ExposureLedger] WARNING: sweeping stale reservation "
              << it->first << " pair=" << it->second.asset_pair << " age_ms="
              << (now_ms - it->second.created_at_ms) << "\n";
    released.push_back(it->first);
    resolveLocked(it, domain::ReservationStatus::Released, "stale", now_ms);
  }
  return released;
}

std::vector<std::string> ExposureLedger::releaseAll(const std::string& reason,
                                                    std::int64_t now_ms) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> released;
  while (!held_.empty()) {
    auto it = held_.begin();
    released.push_back(it->first);
    resolveLocked(it, domain::ReservationStatus::Released, reason, now_ms);
  }
  if (!released.empty()) {
    std::cout << "[ExposureLedger] released " << released.size()
              << " held reservation(s): " << reason << "\n";
  }
  return released;
}

void ExposureLedger::resolveLocked(
    std::map<std::string, domain::ExposureReservation>::iterator it,
    domain::ReservationStatus to, const std::string& reason,
    std::int64_t now_ms) {
  if (!isValidTransition(it->second.status, to)) {
    throw InvariantViolation(std::string("illegal reservation transition ") +
                             domain::toString(it->second.status) + " -> " +
                             domain::toString(to) + " for " + it->first);
  }

  domain::ExposureReservation r = std::move(it->second);
  held_.erase(it);

  r.status = to;
  r.release_reason = reason;
  r.resolved_at_ms = now_ms;

  history_.push_back(std::move(r));
  while (history_.size() > history_capacity_) {
    history_.pop_front();
  }
}

std::optional<domain::ExposureReservation> ExposureLedger::find(
    const std::string& reservation_id) const {
  std::lock_guard lock(mutex_);

  auto it = held_.find(reservation_id);
  if (it != held_.end()) {
    return it->second;
  }
  // Newest first: ids are never reused, but this finds recent ones faster.
  for (auto h = history_.rbegin(); h != history_.rend(); ++h) {
    if (h->id == reservation_id) {
      return *h;
    }
  }
  return std::nullopt;
}

std::optional<domain::ExposureReservation> ExposureLedger::heldFor(
    const std::string& asset_pair) const {
  std::lock_guard lock(mutex_);
  for (const auto& [id, r] : held_) {
    if (r.asset_pair == asset_pair) {
      return r;
    }
  }
  return std::nullopt;
}

std::vector<domain::ExposureReservation> ExposureLedger::held() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::ExposureReservation> out;
  out.reserve(held_.size());
  for (const auto& [id, r] : held_) {
    out.push_back(r);
  }
  return out;
}

std::vector<domain::ExposureReservation> ExposureLedger::history() const {
  std::lock_guard lock(mutex_);
  return {history_.begin(), history_.end()};
}

std::size_t ExposureLedger::heldCount() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

double ExposureLedger::heldNotional() const {
  std::lock_guard lock(mutex_);
  double total = 0.0;
  for (const auto& [id, r] : held_) {
    total += r.notional;
  }
  return total;
}

double ExposureLedger::heldMargin() const {
  std::lock_guard lock(mutex_);
  double total = 0.0;
  for (const auto& [id, r] : held_) {
    total += r.margin;
  }
  return total;
}

}  // namespace tradeloop
