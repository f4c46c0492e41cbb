#pragma once

#include <cstdint>
#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// ReservationStatus — lifecycle of an ExposureReservation
// -----------------------------------------------------------------------------
//
// State machine:
//
//   Held ──┬──► Committed     (order confirmed filled)
//          └──► Released      (rejected, failed, timed out, swept as stale)
//
// Committed and Released are terminal. ExposureLedger::isValidTransition()
// encodes this table.
// -----------------------------------------------------------------------------
enum class ReservationStatus : std::uint8_t { Held, Committed, Released };

inline const char* toString(ReservationStatus s) {
  switch (s) {
    case ReservationStatus::Held:      return "HELD";
    case ReservationStatus::Committed: return "COMMITTED";
    case ReservationStatus::Released:  return "RELEASED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// ExposureReservation — capital earmarked for a trade that is being placed
// -----------------------------------------------------------------------------
//
// @brief  Owned exclusively by ExposureLedger. Other components only ever
//         see copies.
//
// @details
// A reservation is Held exactly while its order submission is in flight or
// not yet reconciled. While Held, its margin counts against the margin
// headroom of every subsequent risk check.
// -----------------------------------------------------------------------------
struct ExposureReservation {
  std::string id;
  std::string decision_id;
  std::string asset_pair;
  double notional{0.0};
  double margin{0.0};
  ReservationStatus status{ReservationStatus::Held};
  std::string release_reason;
  std::int64_t created_at_ms{0};
  std::int64_t resolved_at_ms{0};
};

}  // namespace domain
}  // namespace tradeloop
