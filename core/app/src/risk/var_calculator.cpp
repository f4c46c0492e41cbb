#include "tradeloop/risk/var_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tradeloop {

VarCalculator::VarCalculator(double confidence, std::size_t min_samples)
    : confidence_(std::clamp(confidence, 0.5, 0.9999)),
      min_samples_(std::max<std::size_t>(min_samples, 1)) {}

VarResult VarCalculator::compute(
    const std::vector<VarExposure>& exposures) const {
  VarResult result;
  if (exposures.empty()) {
    return result;
  }

  std::size_t n = std::numeric_limits<std::size_t>::max();
  for (const auto& e : exposures) {
    n = std::min(n, e.returns.size());
  }
  result.samples = n;
  if (n < min_samples_) {
    return result;
  }

  std::vector<double> pnl(n, 0.0);
  for (const auto& e : exposures) {
    const std::size_t offset = e.returns.size() - n;
    for (std::size_t t = 0; t < n; ++t) {
      pnl[t] += e.signed_notional * e.returns[offset + t];
    }
  }

  std::sort(pnl.begin(), pnl.end());

  auto index = static_cast<std::size_t>(
      std::llround(static_cast<double>(n) * (1.0 - confidence_)));
  index = std::min(index, n - 1);

  result.computed = true;
  result.var_amount = std::max(0.0, -pnl[index]);
  return result;
}

}  // namespace tradeloop
