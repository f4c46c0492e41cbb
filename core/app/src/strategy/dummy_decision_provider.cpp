#include "tradeloop/strategy/dummy_decision_provider.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradeloop {

std::optional<domain::Decision> DummyDecisionProvider::proposeDecision(
    const domain::MarketSnapshot& snapshot,
    const std::optional<domain::PortfolioSnapshot>& /*portfolio*/) {
  if (snapshot.price <= 0.0) {
    return std::nullopt;
  }

  domain::Decision d;
  d.asset_pair = snapshot.asset_pair;
  d.entry_price = snapshot.price;
  d.providers.push_back(kProviderId);

  const double strength = std::abs(snapshot.trend);
  if (snapshot.trend >= settings_.trend_threshold &&
      snapshot.rsi < settings_.overbought_rsi) {
    d.action = domain::Action::Buy;
  } else if (snapshot.trend <= -settings_.trend_threshold &&
             snapshot.rsi > settings_.oversold_rsi) {
    d.action = domain::Action::Sell;
  } else {
    d.action = domain::Action::Hold;
  }

  if (d.action == domain::Action::Hold) {
    d.confidence = 0.5;
  } else {
    const double ratio =
        std::min(1.0, strength / (2.0 * settings_.trend_threshold));
    d.confidence = std::clamp(ratio, 0.5, 1.0);
  }

  if (snapshot.volatility > 0.0) {
    d.stop_loss_fraction =
        std::min(0.5, settings_.stop_volatility_multiple * snapshot.volatility);
  }

  std::ostringstream why;
  why << "trend=" << snapshot.trend << " rsi=" << snapshot.rsi;
  d.reasoning = why.str();
  return d;
}

}  // namespace tradeloop
