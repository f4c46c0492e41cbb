#include "tradeloop/risk/position_sizer.hpp"

#include <algorithm>

namespace tradeloop {

double PositionSizer::size(const domain::Decision& decision, double price,
                           const std::optional<domain::Balance>& balance) const {
  if (decision.action == domain::Action::Hold || !balance.has_value() ||
      price <= 0.0 || balance->equity <= 0.0) {
    return 0.0;
  }

  const double equity = balance->equity;
  const double cap = settings_.max_position_fraction * equity / price;

  if (decision.recommended_position_size.has_value() &&
      *decision.recommended_position_size > 0.0) {
    return std::min(*decision.recommended_position_size, cap);
  }

  double stop = decision.stop_loss_fraction.value_or(settings_.default_stop_loss);
  if (stop <= 0.0) {
    stop = settings_.default_stop_loss;
  }

  double units = equity * settings_.risk_per_trade / (price * stop);
  return std::clamp(units, 0.0, cap);
}

}  // namespace tradeloop
