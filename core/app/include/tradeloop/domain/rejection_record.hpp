#pragma once

#include "tradeloop/domain/decision.hpp"

#include <cstdint>
#include <string>

namespace tradeloop {
namespace domain {

// Reason codes published in risk_rejected events. Order matches the order
// in which RiskGatekeeper runs its checks.
enum class RejectionReason : std::uint8_t {
  CooldownActive,
  StaleData,
  CorrelationLimit,
  VarLimit,
  MarginLimit,
  VolatilityLimit
};

inline const char* toString(RejectionReason r) {
  switch (r) {
    case RejectionReason::CooldownActive:   return "cooldown_active";
    case RejectionReason::StaleData:        return "stale_data";
    case RejectionReason::CorrelationLimit: return "correlation_limit";
    case RejectionReason::VarLimit:         return "var_limit";
    case RejectionReason::MarginLimit:      return "margin_limit";
    case RejectionReason::VolatilityLimit:  return "volatility_limit";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RejectionRecord — one entry of the rejection cooldown cache
// -----------------------------------------------------------------------------
//
// @brief  Remembers that (asset pair, action) was rejected so an identical
//         proposal is not re-evaluated until the entry expires.
//
// @details
// fingerprint = "<asset_pair>|<ACTION>|<time bucket>", where the bucket is
// rejected_at_ms / cooldown_ms. The bucket makes the fingerprint unique per
// rejection window in logs; lookups are keyed by (asset_pair, action) and
// honour expires_at_ms, so a record never outlives its expiry.
// -----------------------------------------------------------------------------
struct RejectionRecord {
  std::string fingerprint;
  std::string asset_pair;
  Action action{Action::Hold};
  RejectionReason reason{RejectionReason::CooldownActive};
  std::int64_t rejected_at_ms{0};
  std::int64_t expires_at_ms{0};
};

}  // namespace domain
}  // namespace tradeloop
