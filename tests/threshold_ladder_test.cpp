#include "level/threshold_ladder.hpp"
#include "level/level_error.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <utility>
#include <algorithm>
#include <random>

using namespace aslmix;

TEST(ThresholdLadderTest, GeometricAndEndsAtPeak) {
    const double cMax = 0.4375;
    const auto c = buildThresholdLadder(cMax, 2.0, 30);
    ASSERT_EQ(c.size(), 30u);
    EXPECT_DOUBLE_EQ(c.back(), cMax);
    EXPECT_DOUBLE_EQ(c.front(), cMax / std::pow(2.0, 29));
    for (std::size_t j = 1; j < c.size(); ++j) {
        EXPECT_GT(c[j], c[j - 1]);
        EXPECT_NEAR(c[j] / c[j - 1], 2.0, 1e-12);
    }
}

TEST(ThresholdLadderTest, OtherRatioAndCount) {
    const auto c = buildThresholdLadder(0.9, 3.0, 5);
    ASSERT_EQ(c.size(), 5u);
    EXPECT_DOUBLE_EQ(c.back(), 0.9);
    EXPECT_NEAR(c.front(), 0.9 / 81.0, 1e-15);
    const auto single = buildThresholdLadder(0.2, 2.0, 1);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_DOUBLE_EQ(single[0], 0.2);
}

TEST(ThresholdLadderTest, ZeroPeakIsDegenerate) {
    try {
        buildThresholdLadder(0.0, 2.0, 30);
        FAIL() << "expected LevelError";
    } catch (const LevelError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DegenerateSignal);
    }
}

TEST(ThresholdLadderTest, BadShapeIsInvalid) {
    for (auto [ratio, levels] : {std::pair{1.0, 30}, std::pair{0.5, 30}, std::pair{2.0, 0}}) {
        try {
            buildThresholdLadder(0.5, ratio, levels);
            FAIL() << "expected LevelError for ratio " << ratio << " levels " << levels;
        } catch (const LevelError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
        }
    }
}

TEST(ThresholdLadderTest, FixedLadderFromBitDepth) {
    const auto c = buildFixedLadder(16);
    ASSERT_EQ(c.size(), 15u);
    EXPECT_DOUBLE_EQ(c.front(), std::ldexp(1.0, -15));
    EXPECT_DOUBLE_EQ(c.back(), 0.5);
    EXPECT_THROW(buildFixedLadder(1), LevelError);
}

TEST(ActivityProfileTest, CountsSamplesAtOrAboveEachThreshold) {
    const Samples smoothed{0.1, 0.2, 0.4, 0.8};
    const std::vector<double> c{0.1, 0.2, 0.4, 0.8, 1.6};
    const auto prof = profileActivity(smoothed, c);
    EXPECT_EQ(prof.counts, (std::vector<std::size_t>{4, 3, 2, 1, 0}));
    EXPECT_DOUBLE_EQ(prof.fractions[0], 1.0);
    EXPECT_DOUBLE_EQ(prof.fractions[1], 0.75);
    EXPECT_DOUBLE_EQ(prof.fractions[4], 0.0);
}

TEST(ActivityProfileTest, FractionsAreNonIncreasing) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    Samples smoothed(4000);
    for (auto& v : smoothed) v = dist(rng) * dist(rng);
    const double cMax = *std::max_element(smoothed.begin(), smoothed.end());

    const auto prof = profileActivity(smoothed, buildThresholdLadder(cMax, 2.0, 30));
    for (std::size_t j = 1; j < prof.fractions.size(); ++j) {
        EXPECT_GE(prof.fractions[j - 1], prof.fractions[j]);
    }
    EXPECT_GE(prof.counts.back(), 1u);  // the peak itself
}
