// =============================================================================
// risk_math_test.cpp
// =============================================================================
// Unit tests for the numeric building blocks of the risk gate:
// tradeloop::CorrelationAnalyzer and tradeloop::VarCalculator.
//
// Validates:
//   - Pearson r of identical / mirrored / tail-aligned series
//   - Undefined correlation (too few samples, zero variance) is nullopt
//   - Historical VaR picks the loss at round(n * (1 - confidence))
//   - Short exposures lose on up moves
//   - Too little joint history leaves VaR uncomputed
// =============================================================================

#include "tradeloop/risk/correlation_analyzer.hpp"
#include "tradeloop/risk/var_calculator.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <vector>

using tradeloop::CorrelationAnalyzer;
using tradeloop::VarCalculator;
using tradeloop::VarExposure;
using tradeloop::fakes::zigzagReturns;

// =============================================================================
// CorrelationAnalyzer
// =============================================================================
TEST(CorrelationAnalyzerTest, IdenticalSeriesAreFullyCorrelated) {
  CorrelationAnalyzer analyzer(10);
  auto a = zigzagReturns(20, 0.01);

  auto r = analyzer.correlation(a, a);
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r, 1.0, 1e-12);
}

TEST(CorrelationAnalyzerTest, MirroredSeriesAreNegativelyCorrelated) {
  CorrelationAnalyzer analyzer(10);
  auto a = zigzagReturns(20, 0.01);
  auto b = zigzagReturns(20, -0.02);

  auto r = analyzer.correlation(a, b);
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r, -1.0, 1e-12);
}

TEST(CorrelationAnalyzerTest, ScaleDoesNotChangeCorrelation) {
  CorrelationAnalyzer analyzer(10);
  auto a = zigzagReturns(16, 0.01);
  auto b = zigzagReturns(16, 0.5);

  auto r = analyzer.correlation(a, b);
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r, 1.0, 1e-12);
}

// -----------------------------------------------------------------------------
// Series are aligned on their newest samples: older history on one side is
// ignored, however different it is.
// -----------------------------------------------------------------------------
TEST(CorrelationAnalyzerTest, LongerSeriesIsTailAligned) {
  CorrelationAnalyzer analyzer(10);
  auto recent = zigzagReturns(12, 0.01);

  std::vector<double> longer = {0.9, -0.9, 0.3, 0.7, -0.2};
  longer.insert(longer.end(), recent.begin(), recent.end());

  auto r = analyzer.correlation(longer, recent);
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r, 1.0, 1e-12);
}

TEST(CorrelationAnalyzerTest, TooFewSamplesIsUndefined) {
  CorrelationAnalyzer analyzer(10);
  auto a = zigzagReturns(9, 0.01);

  EXPECT_FALSE(analyzer.correlation(a, a).has_value());
}

TEST(CorrelationAnalyzerTest, ConstantSeriesIsUndefined) {
  CorrelationAnalyzer analyzer(5);
  std::vector<double> flat(10, 0.01);
  auto moving = zigzagReturns(10, 0.01);

  EXPECT_FALSE(analyzer.correlation(flat, moving).has_value());
}

TEST(CorrelationAnalyzerTest, MinimumSamplesClampedToTwo) {
  CorrelationAnalyzer analyzer(0);
  EXPECT_EQ(analyzer.minSamples(), 2u);

  auto r = analyzer.correlation({0.01, 0.02}, {0.02, 0.04});
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r, 1.0, 1e-12);
}

// =============================================================================
// VarCalculator
// =============================================================================
namespace {

// Two bad periods followed by eighteen small gains.
std::vector<double> twoLossSeries() {
  std::vector<double> r = {-0.10, -0.05};
  r.insert(r.end(), 18, 0.01);
  return r;
}

}  // namespace

// -----------------------------------------------------------------------------
// n = 20, confidence 0.95 → index round(20 * 0.05) = 1, the second-worst
// period: 1000 * -0.05 = -50.
// -----------------------------------------------------------------------------
TEST(VarCalculatorTest, LongExposureLosesOnDownMoves) {
  VarCalculator var(0.95, 10);
  auto result = var.compute({VarExposure{"BTCUSD", 1000.0, twoLossSeries()}});

  ASSERT_TRUE(result.computed);
  EXPECT_EQ(result.samples, 20u);
  EXPECT_NEAR(result.var_amount, 50.0, 1e-9);
}

TEST(VarCalculatorTest, ShortExposureLosesOnUpMoves) {
  VarCalculator var(0.95, 10);
  auto result = var.compute({VarExposure{"BTCUSD", -1000.0, twoLossSeries()}});

  // Sorted pnl: eighteen -10s, then +50, +100. Index 1 is -10.
  ASSERT_TRUE(result.computed);
  EXPECT_NEAR(result.var_amount, 10.0, 1e-9);
}

TEST(VarCalculatorTest, NoLossAtConfidenceMeansZeroVar) {
  VarCalculator var(0.95, 5);
  std::vector<double> gains(20, 0.01);

  auto result = var.compute({VarExposure{"ETHUSD", 500.0, gains}});
  ASSERT_TRUE(result.computed);
  EXPECT_DOUBLE_EQ(result.var_amount, 0.0);
}

// -----------------------------------------------------------------------------
// Offsetting exposures: a long and an equal short on perfectly correlated
// assets cancel period by period.
// -----------------------------------------------------------------------------
TEST(VarCalculatorTest, HedgedExposuresNetOut) {
  VarCalculator var(0.95, 10);
  auto returns = twoLossSeries();

  auto result = var.compute({VarExposure{"BTCUSD", 1000.0, returns},
                             VarExposure{"XBTUSD", -1000.0, returns}});
  ASSERT_TRUE(result.computed);
  EXPECT_NEAR(result.var_amount, 0.0, 1e-9);
}

TEST(VarCalculatorTest, JointHistoryIsShortestSeries) {
  VarCalculator var(0.95, 10);
  auto longer = twoLossSeries();
  std::vector<double> shorter(12, 0.01);

  auto result = var.compute({VarExposure{"BTCUSD", 1000.0, longer},
                             VarExposure{"ETHUSD", 1000.0, shorter}});
  ASSERT_TRUE(result.computed);
  EXPECT_EQ(result.samples, 12u);
  // The newest 12 BTCUSD returns are all +1%: no loss.
  EXPECT_DOUBLE_EQ(result.var_amount, 0.0);
}

TEST(VarCalculatorTest, InsufficientHistoryIsNotComputed) {
  VarCalculator var(0.95, 30);
  auto result = var.compute({VarExposure{"BTCUSD", 1000.0, twoLossSeries()}});

  EXPECT_FALSE(result.computed);
  EXPECT_EQ(result.samples, 20u);
}

TEST(VarCalculatorTest, NoExposuresIsNotComputed) {
  VarCalculator var(0.95, 1);
  EXPECT_FALSE(var.compute({}).computed);
}

TEST(VarCalculatorTest, ConfidenceIsClamped) {
  EXPECT_DOUBLE_EQ(VarCalculator(0.2, 10).confidence(), 0.5);
  EXPECT_DOUBLE_EQ(VarCalculator(1.0, 10).confidence(), 0.9999);
}
