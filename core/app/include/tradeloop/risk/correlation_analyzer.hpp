#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// CorrelationAnalyzer — Pearson correlation between two return series
// -----------------------------------------------------------------------------
//
// @brief  Used by RiskGatekeeper's correlation exposure check.
//
// @details
// Series are aligned on their most recent samples: with lengths n and m,
// the last min(n, m) values of each are paired. Returns std::nullopt when
// fewer than min_samples pairs overlap or when either side has zero
// variance, since no meaningful coefficient exists then. The gatekeeper
// counts an undefined correlation as "not correlated" and reports it in
// telemetry.
//
// Thread model: Stateless after construction; const methods only.
// -----------------------------------------------------------------------------
class CorrelationAnalyzer {
 public:
  explicit CorrelationAnalyzer(std::size_t min_samples)
      : min_samples_(min_samples < 2 ? 2 : min_samples) {}

  std::optional<double> correlation(const std::vector<double>& a,
                                    const std::vector<double>& b) const;

  std::size_t minSamples() const { return min_samples_; }

 private:
  std::size_t min_samples_;
};

}  // namespace tradeloop
