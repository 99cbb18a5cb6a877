#include "renko/brick_size.hpp"
#include "renko/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace renko;

namespace {

std::vector<Candle> flat_series(std::size_t n, double price) {
    std::vector<Candle> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back({static_cast<long long>(i) * 60000, price, price, price, price, 1.0});
    }
    return out;
}

Candle bar(long long t, double o, double h, double l, double c) {
    return Candle{t, o, h, l, c, 1.0};
}

} // namespace

TEST(AtrTest, NeedsTwoBars) {
    try {
        atr_brick_size(flat_series(1, 10.0), 14);
        FAIL() << "expected InsufficientData";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InsufficientData);
    }
}

TEST(AtrTest, ShortSeriesUsesAllTrueRanges) {
    std::vector<Candle> bars = {
        bar(1, 10, 11, 9, 10),
        bar(2, 10, 12, 10, 11),    // tr = max(2, 2, 0) = 2
        bar(3, 11, 11.5, 8, 9),    // tr = max(3.5, 0.5, 3) = 3.5
    };
    EXPECT_DOUBLE_EQ(atr_brick_size(bars, 14), (2.0 + 3.5) / 2.0);
}

TEST(AtrTest, UsesTrailingWindowOnly) {
    std::vector<Candle> bars;
    // 10 bars with a 4-point range, then 5 bars with a 1-point range
    for (int i = 0; i < 10; ++i) bars.push_back(bar(i, 100, 102, 98, 100));
    for (int i = 10; i < 15; ++i) bars.push_back(bar(i, 100, 100.5, 99.5, 100));
    EXPECT_DOUBLE_EQ(atr_brick_size(bars, 5), 1.0);
    EXPECT_DOUBLE_EQ(atr_brick_size(bars, 14), (4.0 * 9 + 1.0 * 5) / 14.0);
}

TEST(AtrTest, GapUsesPreviousClose) {
    std::vector<Candle> bars = {bar(1, 10, 10, 10, 10), bar(2, 15, 15, 15, 15)};
    EXPECT_DOUBLE_EQ(atr_brick_size(bars, 14), 5.0);
}

TEST(AtrTest, FlatSeriesIsDegenerate) {
    try {
        atr_brick_size(flat_series(20, 50.0), 14);
        FAIL() << "expected DegenerateSeries";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateSeries);
    }
}

TEST(AtrTest, RejectsNonPositiveLookback) {
    EXPECT_THROW(atr_brick_size(flat_series(3, 1.0), 0), std::invalid_argument);
}

TEST(StatisticalTest, HalfPopulationStdDev) {
    std::vector<Candle> bars = {bar(1, 2, 2, 2, 2), bar(2, 4, 4, 4, 4), bar(3, 4, 4, 4, 4), bar(4, 4, 4, 4, 4),
                                bar(5, 5, 5, 5, 5), bar(6, 5, 5, 5, 5), bar(7, 7, 7, 7, 7), bar(8, 9, 9, 9, 9)};
    // population std-dev of {2,4,4,4,5,5,7,9} is exactly 2
    EXPECT_DOUBLE_EQ(statistical_brick_size(bars), 1.0);
}

TEST(StatisticalTest, TwentyBarsAtFiftyAreDegenerate) {
    try {
        statistical_brick_size(flat_series(20, 50.0));
        FAIL() << "expected DegenerateSeries";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateSeries);
    }
}

TEST(StatisticalTest, EmptySeriesIsInsufficient) {
    try {
        statistical_brick_size({});
        FAIL() << "expected InsufficientData";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InsufficientData);
    }
}

TEST(EstimateTest, AtrStrategyWhenItWorks) {
    std::vector<Candle> bars = {bar(1, 10, 10, 10, 10), bar(2, 12, 12, 12, 12)};
    PipelineConfig config;
    auto est = estimate_brick_size(bars, config);
    EXPECT_DOUBLE_EQ(est.value, 2.0);
    EXPECT_EQ(est.strategy, BrickStrategy::Atr);
    EXPECT_FALSE(est.fallback);
    EXPECT_FALSE(est.substituted_minimum);
}

TEST(EstimateTest, FallsBackToStatisticalWhenAtrLacksData) {
    PipelineConfig config;
    auto est = estimate_brick_size({bar(1, 10, 20, 5, 10)}, config);
    // one bar: ATR cannot run, std-dev of one close is zero
    EXPECT_TRUE(est.fallback);
    EXPECT_TRUE(est.substituted_minimum);
    EXPECT_DOUBLE_EQ(est.value, config.min_brick_size);
    EXPECT_NE(est.fallback_reason.find("atr"), std::string::npos);
    EXPECT_NE(est.fallback_reason.find("statistical"), std::string::npos);
}

TEST(EstimateTest, FlatTrailingWindowFallsBackToStatistical) {
    std::vector<Candle> bars = {bar(0, 10, 10, 10, 10)};
    for (int i = 1; i <= 15; ++i) bars.push_back(bar(i, 20, 20, 20, 20));
    PipelineConfig config;
    auto est = estimate_brick_size(bars, config);
    EXPECT_TRUE(est.fallback);
    EXPECT_FALSE(est.substituted_minimum);
    EXPECT_EQ(est.strategy, BrickStrategy::Statistical);
    EXPECT_DOUBLE_EQ(est.value, statistical_brick_size(bars));
    EXPECT_GT(est.value, 0.0);
}

TEST(EstimateTest, StatisticalStrategyWhenConfigured) {
    std::vector<Candle> bars = {bar(1, 2, 2, 2, 2), bar(2, 4, 4, 4, 4)};
    PipelineConfig config;
    config.brick_strategy = BrickStrategy::Statistical;
    auto est = estimate_brick_size(bars, config);
    EXPECT_EQ(est.strategy, BrickStrategy::Statistical);
    EXPECT_FALSE(est.fallback);
    EXPECT_DOUBLE_EQ(est.value, 0.5);
}

TEST(EstimateTest, ConstantSeriesSubstitutesMinimum) {
    PipelineConfig config;
    auto est = estimate_brick_size(flat_series(20, 50.0), config);
    EXPECT_TRUE(est.fallback);
    EXPECT_TRUE(est.substituted_minimum);
    EXPECT_DOUBLE_EQ(est.value, config.min_brick_size);
}

TEST(EstimateTest, DoesNotMutateInput) {
    auto bars = flat_series(5, 3.0);
    bars[4].close = 4.0;
    auto copy = bars;
    estimate_brick_size(bars, PipelineConfig{});
    for (std::size_t i = 0; i < bars.size(); ++i) EXPECT_EQ(bars[i].close, copy[i].close);
}
