#include "renko/errors.hpp"
#include "renko/renko.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace renko;

namespace {

std::vector<Candle> closes(const std::vector<double>& values) {
    std::vector<Candle> out;
    long long t = 0;
    for (double v : values) {
        t += 60000;
        out.push_back({t, v, v, v, v, 1.0});
    }
    return out;
}

} // namespace

TEST(RenkoTest, WalkOverClosesMatchesHandComputedBricks) {
    auto bricks = build_renko(closes({100, 103, 107, 104, 101}), 3.0);
    ASSERT_EQ(bricks.size(), 3u);
    EXPECT_DOUBLE_EQ(bricks[0].value, 103.0);
    EXPECT_DOUBLE_EQ(bricks[1].value, 106.0);
    EXPECT_DOUBLE_EQ(bricks[2].value, 103.0);
    EXPECT_EQ(bricks[0].dir, 1);
    EXPECT_EQ(bricks[1].dir, 1);
    EXPECT_EQ(bricks[2].dir, -1);
    EXPECT_EQ(bricks[0].brick_time, 2 * 60000);
    EXPECT_EQ(bricks[1].brick_time, 3 * 60000);
    EXPECT_EQ(bricks[2].brick_time, 5 * 60000);
}

TEST(RenkoTest, SynthesizedOhlcFollowsPredecessor) {
    auto bricks = build_renko(closes({100, 103, 107, 104, 101}), 3.0);
    ASSERT_EQ(bricks.size(), 3u);

    EXPECT_DOUBLE_EQ(bricks[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bricks[0].close, 103.0);
    EXPECT_DOUBLE_EQ(bricks[0].high, 103.3);
    EXPECT_DOUBLE_EQ(bricks[0].low, 99.7);

    EXPECT_DOUBLE_EQ(bricks[2].open, 106.0);
    EXPECT_DOUBLE_EQ(bricks[2].close, 103.0);
    EXPECT_DOUBLE_EQ(bricks[2].high, 106.3);
    EXPECT_DOUBLE_EQ(bricks[2].low, 102.7);
}

TEST(RenkoTest, OneBarCanEmitSeveralBricks) {
    auto bricks = build_renko(closes({10, 20.5}), 2.0);
    ASSERT_EQ(bricks.size(), 5u);
    for (std::size_t i = 0; i < bricks.size(); ++i) {
        EXPECT_DOUBLE_EQ(bricks[i].value, 12.0 + 2.0 * i);
        EXPECT_EQ(bricks[i].brick_time, 2 * 60000);
    }
}

TEST(RenkoTest, FirstDownBrickOpensOneSizeBelow) {
    auto bricks = build_renko(closes({50, 45}), 5.0);
    ASSERT_EQ(bricks.size(), 1u);
    EXPECT_DOUBLE_EQ(bricks[0].value, 45.0);
    EXPECT_DOUBLE_EQ(bricks[0].open, 40.0);
    EXPECT_EQ(bricks[0].dir, -1);
}

TEST(RenkoTest, IgnoresIntrabarExtremes) {
    std::vector<Candle> bars = {
        {60000, 100, 100, 100, 100, 1},
        {120000, 100, 150, 50, 101, 1},
    };
    try {
        build_renko(bars, 5.0);
        FAIL() << "expected NoBricksFormed";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoBricksFormed);
    }
}

TEST(RenkoTest, FlatSeriesFormsNoBricks) {
    try {
        build_renko(closes({5, 5.5, 4.6, 5.2}), 1.0);
        FAIL() << "expected NoBricksFormed";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoBricksFormed);
    }
}

TEST(RenkoTest, EmptyInputFormsNoBricks) {
    EXPECT_THROW(build_renko({}, 1.0), RenkoError);
}

TEST(RenkoTest, RejectsNonPositiveBrickSize) {
    EXPECT_THROW(build_renko(closes({1, 2}), 0.0), std::invalid_argument);
    EXPECT_THROW(build_renko(closes({1, 2}), -1.0), std::invalid_argument);
}

TEST(RenkoTest, BrickInvariantsOnLongerSeries) {
    std::vector<double> values;
    double p = 1000.0;
    for (int i = 0; i < 400; ++i) {
        p += std::sin(i * 0.37) * 4.0 + ((i % 13) - 6) * 0.3;
        values.push_back(p);
    }
    const double size = 2.5;
    auto bricks = build_renko(closes(values), size, 0.1);
    ASSERT_FALSE(bricks.empty());

    for (std::size_t i = 0; i < bricks.size(); ++i) {
        const auto& b = bricks[i];
        EXPECT_DOUBLE_EQ(b.size, size);
        EXPECT_DOUBLE_EQ(b.close, b.value);
        EXPECT_NEAR(std::abs(b.value - b.open), size, 1e-9);
        EXPECT_NEAR(b.high, std::max(b.open, b.close) + 0.1 * size, 1e-9);
        EXPECT_NEAR(b.low, std::min(b.open, b.close) - 0.1 * size, 1e-9);
        if (i > 0) EXPECT_DOUBLE_EQ(b.open, bricks[i - 1].value);
    }
}

TEST(RenkoTest, NeverEmitsBelowThreshold) {
    std::vector<double> values = {100, 101, 99.5, 102.9, 103.1, 100.2, 97.0, 97.5};
    const double size = 3.0;
    RenkoBuilder builder(size);
    double last = values[0];
    std::size_t seen = 0;
    long long t = 0;
    for (double v : values) {
        builder.addClose(t++, v);
        const auto& bricks = builder.getRenkoBricks();
        if (std::abs(v - last) < size && t > 1) {
            EXPECT_EQ(bricks.size(), seen) << "close " << v;
        }
        if (!bricks.empty()) last = bricks.back().value;
        seen = bricks.size();
    }
}

TEST(RenkoTest, IsDeterministic) {
    auto input = closes({10, 13, 19, 11, 8, 14, 20, 2});
    auto a = build_renko(input, 2.0);
    auto b = build_renko(input, 2.0);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].brick_time, b[i].brick_time);
        EXPECT_EQ(a[i].value, b[i].value);
        EXPECT_EQ(a[i].open, b[i].open);
        EXPECT_EQ(a[i].high, b[i].high);
        EXPECT_EQ(a[i].low, b[i].low);
    }
}

TEST(RenkoTest, SynthesizeOhlcWithCustomPadding) {
    std::vector<RenkoBrick> bricks(2);
    bricks[0].value = 10.0;
    bricks[0].size = 2.0;
    bricks[1].value = 8.0;
    bricks[1].size = 2.0;
    synthesize_ohlc(bricks, 0.25);
    EXPECT_DOUBLE_EQ(bricks[0].open, 8.0);
    EXPECT_DOUBLE_EQ(bricks[0].high, 10.5);
    EXPECT_DOUBLE_EQ(bricks[0].low, 7.5);
    EXPECT_DOUBLE_EQ(bricks[1].open, 10.0);
    EXPECT_DOUBLE_EQ(bricks[1].high, 10.5);
    EXPECT_DOUBLE_EQ(bricks[1].low, 7.5);
}

TEST(RenkoTest, BrickBelowPriceResolutionFailsInsteadOfLooping) {
    // 1e15 has a floating-point spacing of 0.125, so 0.125 / 14 cannot move it.
    std::vector<double> values(14, 1e15);
    values.push_back(1e15 + 0.125);
    try {
        build_renko(closes(values), 0.125 / 14);
        FAIL() << "expected RenkoError";
    } catch (const RenkoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateSeries);
    }
}

TEST(RenkoTest, LargeMoveEmitsFlooredBrickCount) {
    auto bricks = build_renko(closes({100, 110.5}), 1.0);
    ASSERT_EQ(bricks.size(), 10u);
    EXPECT_DOUBLE_EQ(bricks.back().value, 110.0);
    for (const auto& b : bricks) EXPECT_EQ(b.brick_time, 2 * 60000);
}
