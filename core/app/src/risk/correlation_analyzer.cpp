#include "tradeloop/risk/correlation_analyzer.hpp"

#include <algorithm>
#include <cmath>

namespace tradeloop {

std::optional<double> CorrelationAnalyzer::correlation(
    const std::vector<double>& a, const std::vector<double>& b) const {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < min_samples_) {
    return std::nullopt;
  }

  // Tail alignment: pair the newest n samples of each series.
  const std::size_t offset_a = a.size() - n;
  const std::size_t offset_b = b.size() - n;

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mean_a += a[offset_a + i];
    mean_b += b[offset_b + i];
  }
  mean_a /= static_cast<double>(n);
  mean_b /= static_cast<double>(n);

  double cov = 0.0;
  double var_a = 0.0;
  double var_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = a[offset_a + i] - mean_a;
    const double db = b[offset_b + i] - mean_b;
    cov += da * db;
    var_a += da * da;
    var_b += db * db;
  }

  if (var_a <= 0.0 || var_b <= 0.0) {
    return std::nullopt;
  }

  double r = cov / std::sqrt(var_a * var_b);
  // Rounding can push |r| a hair past 1 for identical series.
  return std::clamp(r, -1.0, 1.0);
}

}  // namespace tradeloop
