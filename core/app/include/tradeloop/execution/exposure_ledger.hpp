#pragma once

#include "tradeloop/concurrent/id_generator.hpp"
#include "tradeloop/domain/exposure_reservation.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ExposureLedger — reversible capital reservations
// -----------------------------------------------------------------------------
//
// @brief  Tracks capital earmarked for orders that are being placed, so the
//         same free margin cannot be spent twice while a venue call is in
//         flight.
//
// @details
// Reservation lifecycle (see domain::ReservationStatus):
//
//   reserve()  → Held
//   commit()   → Committed  (venue confirmed the fill)
//   release()  → Released   (rejected, failed, timed out, swept, recovery)
//
// Invariants enforced here:
//   - At most one Held reservation per asset pair. reserve() throws
//     InvariantViolation on a second one; that is a bug in the caller, not
//     a market condition.
//   - Only Held → Committed and Held → Released are legal. commit() on a
//     reservation that is not Held throws InvariantViolation. release() of
//     an already-resolved reservation is a no-op returning false, so that a
//     rollback guard and the age sweep can both try to release safely.
//
// Held reservations live in held_ (keyed by id). Resolved ones move to a
// bounded history (oldest dropped first) used by find() and by tests.
//
// Thread model:
//   Shared mutable resource. Each public method runs under mutex_, so
//   reserve() checks and inserts atomically. Safe from any thread; the IPC
//   thread reads heldCount() for STATUS.
//
// Ownership:
//   Owned by AgentRuntime (or the test). ExecutionStage and RecoveryManager
//   hold a mutable reference; RiskGatekeeper a const one.
// -----------------------------------------------------------------------------
class ExposureLedger {
 public:
  explicit ExposureLedger(std::size_t history_capacity = 256);

  ExposureLedger(const ExposureLedger&) = delete;
  ExposureLedger& operator=(const ExposureLedger&) = delete;

  // -------------------------------------------------------------------------
  // reserve(decision_id, asset_pair, notional, margin, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Creates a Held reservation.
  //
  // @return The new reservation id ("RSV-<n>").
  // @throws InvariantViolation if asset_pair already has a Held reservation,
  //         or if notional / margin is negative.
  // -------------------------------------------------------------------------
  std::string reserve(const std::string& decision_id,
                      const std::string& asset_pair, double notional,
                      double margin, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // commit(reservation_id, now_ms)
  // -------------------------------------------------------------------------
  // @throws InvariantViolation if the id is unknown or not Held.
  // -------------------------------------------------------------------------
  void commit(const std::string& reservation_id, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // release(reservation_id, reason, now_ms)
  // -------------------------------------------------------------------------
  // @return true if the reservation was Held and is now Released; false if
  //         it was already resolved or is unknown (logged).
  // -------------------------------------------------------------------------
  bool release(const std::string& reservation_id, const std::string& reason,
               std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // sweepStale(now_ms, max_age_ms)
  // -------------------------------------------------------------------------
  // @brief  Releases every Held reservation created more than max_age_ms ago
  //         (age strictly greater than max_age_ms).
  //
  // @return Ids of the released reservations, oldest first.
  // -------------------------------------------------------------------------
  std::vector<std::string> sweepStale(std::int64_t now_ms,
                                      std::int64_t max_age_ms);

  // Releases every Held reservation. Used at startup recovery.
  std::vector<std::string> releaseAll(const std::string& reason,
                                      std::int64_t now_ms);

  std::optional<domain::ExposureReservation> find(
      const std::string& reservation_id) const;

  std::optional<domain::ExposureReservation> heldFor(
      const std::string& asset_pair) const;

  std::vector<domain::ExposureReservation> held() const;
  std::vector<domain::ExposureReservation> history() const;

  std::size_t heldCount() const;
  double heldNotional() const;
  double heldMargin() const;

  static bool isValidTransition(domain::ReservationStatus from,
                                domain::ReservationStatus to);

 private:
  // Moves a Held reservation into history_ with the given terminal status.
  // Caller holds mutex_.
  void resolveLocked(std::map<std::string, domain::ExposureReservation>::iterator it,
                     domain::ReservationStatus to, const std::string& reason,
                     std::int64_t now_ms);

  const std::size_t history_capacity_;
  IdGenerator ids_{"RSV"};

  mutable std::mutex mutex_;
  std::map<std::string, domain::ExposureReservation> held_;
  std::deque<domain::ExposureReservation> history_;
};

}  // namespace tradeloop
