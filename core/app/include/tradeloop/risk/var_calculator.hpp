#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tradeloop {

// One asset's contribution to portfolio VaR.
struct VarExposure {
  std::string asset_pair;
  double signed_notional{0.0};  // +long, -short, in account currency
  std::vector<double> returns;  // periodic returns, oldest first
};

struct VarResult {
  bool computed{false};
  double var_amount{0.0};   // loss in account currency, >= 0
  std::size_t samples{0};
};

// -----------------------------------------------------------------------------
// VarCalculator — historical-simulation Value-at-Risk
// -----------------------------------------------------------------------------
//
// @brief  One-period portfolio VaR at a given confidence from the joint
//         history of every exposure's returns.
//
// @details
// For the newest n periods common to every exposure:
//
//   pnl[t] = Σ_i signed_notional_i * returns_i[t]
//
// The pnl series is sorted ascending and the loss at index
// round(n * (1 - confidence)), clamped to [0, n-1], is the VaR. A positive
// pnl at that index means no loss at that confidence and VaR is 0.
//
// Not computed (computed == false) when there are no exposures or fewer
// than min_samples joint periods. The gatekeeper skips the check in that
// case and says so in its telemetry.
// -----------------------------------------------------------------------------
class VarCalculator {
 public:
  VarCalculator(double confidence, std::size_t min_samples);

  VarResult compute(const std::vector<VarExposure>& exposures) const;

  double confidence() const { return confidence_; }

 private:
  double confidence_;
  std::size_t min_samples_;
};

}  // namespace tradeloop
