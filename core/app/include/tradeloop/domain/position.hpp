#pragma once

#include <cstdint>
#include <string>

namespace tradeloop {
namespace domain {

enum class Side : std::uint8_t { Long, Short };

inline const char* toString(Side s) {
  switch (s) {
    case Side::Long:  return "LONG";
    case Side::Short: return "SHORT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Position — an open position as reported by the trading venue
// -----------------------------------------------------------------------------
//
// @brief  Read-only mirror of venue state. The venue is the source of truth;
//         the agent never mutates a Position, it only asks the venue to close
//         one.
//
// @details
// size is always positive; direction is carried by side. current_price
// may be 0 when the venue does not report a mark price, in which case
// markPrice() falls back to the entry price.
//
// Sign convention for unrealized_pnl:
//   positive → position is in profit
//   negative → position is losing (recovery closes the most negative first)
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string asset_pair;
  Side side{Side::Long};
  double size{0.0};
  double entry_price{0.0};
  double current_price{0.0};
  double unrealized_pnl{0.0};
  std::int64_t opened_at_ms{0};

  double markPrice() const {
    return current_price > 0.0 ? current_price : entry_price;
  }

  // Signed notional: +long, -short.
  double signedNotional() const {
    double notional = size * markPrice();
    return side == Side::Long ? notional : -notional;
  }
};

// -----------------------------------------------------------------------------
// ClosedTrade — a completed round trip reported by the trade monitor
// -----------------------------------------------------------------------------
struct ClosedTrade {
  std::string trade_id;
  std::string decision_id;
  std::string asset_pair;
  Side side{Side::Long};
  double size{0.0};
  double entry_price{0.0};
  double exit_price{0.0};
  double realized_pnl{0.0};
  std::int64_t opened_at_ms{0};
  std::int64_t closed_at_ms{0};
};

}  // namespace domain
}  // namespace tradeloop
