#include "level/active_level.hpp"
#include "level/level_error.hpp"
#include "test_signals.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace aslmix;
using aslmix::testing::concat;
using aslmix::testing::silence;
using aslmix::testing::sine;

namespace {
constexpr double kFs = 16000.0;
const double kToneRmsDb = 20.0 * std::log10(1.0 / std::sqrt(2.0));
}

TEST(ActiveLevelTest, SilenceHasNoActivity) {
    for (double seconds : {0.001, 0.5, 3.0}) {
        const auto r = ActiveLevelEstimator().estimate(silence(seconds, kFs), kFs);
        EXPECT_EQ(r.status, LevelStatus::DegenerateSignal);
        EXPECT_TRUE(std::isinf(r.activeLevelDb));
        EXPECT_LT(r.activeLevelDb, 0.0);
        EXPECT_EQ(r.activityFraction, 0.0);
        EXPECT_FALSE(r.hasActiveLevel());
    }
}

TEST(ActiveLevelTest, EmptySignalThrows) {
    try {
        ActiveLevelEstimator().estimate({}, kFs);
        FAIL() << "expected LevelError";
    } catch (const LevelError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptySignal);
    }
}

TEST(ActiveLevelTest, NonFiniteSamplesAndBadRateAreInvalid) {
    Samples x = sine(440.0, 0.5, 0.5, kFs);
    x[100] = std::numeric_limits<double>::quiet_NaN();
    try {
        ActiveLevelEstimator().estimate(x, kFs);
        FAIL() << "expected LevelError";
    } catch (const LevelError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
    }
    x[100] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(ActiveLevelEstimator().estimate(x, kFs), LevelError);
    EXPECT_THROW(ActiveLevelEstimator().estimate(sine(440.0, 0.5, 0.5, kFs), 0.0), LevelError);
}

TEST(ActiveLevelTest, RejectsInvalidConfiguration) {
    ActiveLevelEstimator::Config cfg;
    cfg.ratio = 1.0;
    EXPECT_THROW(ActiveLevelEstimator{cfg}, LevelError);
    cfg = {};
    cfg.levels = 0;
    EXPECT_THROW(ActiveLevelEstimator{cfg}, LevelError);
    cfg = {};
    cfg.timeConstant = 0.0;
    EXPECT_THROW(ActiveLevelEstimator{cfg}, LevelError);
}

TEST(ActiveLevelTest, FullScaleToneMatchesItsRms) {
    const auto r = ActiveLevelEstimator().estimate(sine(1000.0, 1.0, 4.0, kFs), kFs);
    ASSERT_EQ(r.status, LevelStatus::Ok);
    EXPECT_NEAR(r.activeLevelDb, kToneRmsDb, 0.5);
    EXPECT_GT(r.activityFraction, 0.95);
    EXPECT_LE(r.activityFraction, 1.05);
    EXPECT_TRUE(r.diagnostics.interpolated);
}

TEST(ActiveLevelTest, QuietToneMatchesItsRms) {
    const auto r = ActiveLevelEstimator().estimate(sine(300.0, 0.05, 3.0, kFs), kFs);
    ASSERT_EQ(r.status, LevelStatus::Ok);
    EXPECT_NEAR(r.activeLevelDb, 20.0 * std::log10(0.05 / std::sqrt(2.0)), 0.5);
}

TEST(ActiveLevelTest, PausesLowerActivityButNotActiveLevel) {
    const Samples tone = sine(500.0, 1.0, 1.0, kFs);
    const Samples x = concat(concat(tone, silence(2.0, kFs)), tone);
    const auto r = ActiveLevelEstimator().estimate(x, kFs);
    ASSERT_EQ(r.status, LevelStatus::Ok);

    // Whole-file RMS sits 6 dB under the tone; the active level stays close to it.
    EXPECT_GT(r.activeLevelDb, kToneRmsDb - 1.5);
    EXPECT_LT(r.activeLevelDb, kToneRmsDb + 0.5);
    EXPECT_GT(r.activityFraction, 0.5);
    EXPECT_LT(r.activityFraction, 0.8);
}

TEST(ActiveLevelTest, ScalingShiftsLevelOnly) {
    const Samples tone = sine(700.0, 0.8, 1.0, kFs);
    const Samples x = concat(concat(tone, silence(0.7, kFs)), tone);
    Samples half(x);
    for (double& s : half) s *= 0.5;

    const ActiveLevelEstimator est;
    const auto a = est.estimate(x, kFs);
    const auto b = est.estimate(half, kFs);
    ASSERT_EQ(a.status, LevelStatus::Ok);
    ASSERT_EQ(b.status, LevelStatus::Ok);
    EXPECT_NEAR(a.activeLevelDb - b.activeLevelDb, 20.0 * std::log10(2.0), 1e-9);
    EXPECT_NEAR(a.activityFraction, b.activityFraction, 1e-12);
}

TEST(ActiveLevelTest, SingleClickHasNoCrossing) {
    Samples x(16000, 0.0);
    x[0] = 1.0;
    const auto r = ActiveLevelEstimator().estimate(x, kFs);
    EXPECT_EQ(r.status, LevelStatus::NoCrossing);
    EXPECT_TRUE(std::isinf(r.activeLevelDb));
    EXPECT_EQ(r.activityFraction, 0.0);
    EXPECT_FALSE(r.diagnostics.deltas.empty());
}

TEST(ActiveLevelTest, DiagnosticsDescribeTheLadder) {
    ActiveLevelEstimator::Config cfg;
    cfg.keepEnvelope = true;
    const Samples x = concat(sine(250.0, 0.3, 1.5, kFs), silence(0.5, kFs));
    const auto r = ActiveLevelEstimator(cfg).estimate(x, kFs);
    ASSERT_EQ(r.status, LevelStatus::Ok);

    const auto& d = r.diagnostics;
    ASSERT_EQ(d.thresholds.size(), 30u);
    ASSERT_EQ(d.smoothedEnvelope.size(), x.size());
    EXPECT_DOUBLE_EQ(d.thresholds.back(),
                     *std::max_element(d.smoothedEnvelope.begin(), d.smoothedEnvelope.end()));
    for (std::size_t j = 1; j < d.thresholds.size(); ++j) {
        EXPECT_GT(d.thresholds[j], d.thresholds[j - 1]);
        EXPECT_GE(d.activityFractions[j - 1], d.activityFractions[j]);
    }
    EXPECT_NEAR(d.activeLevelLinear * d.activeLevelLinear * r.activityFraction, d.meanSquare,
                1e-12 * d.meanSquare);
    EXPECT_NEAR(d.meanSquare, 0.3 * 0.3 / 2.0 * 0.75, 1e-4);
}

TEST(ActiveLevelTest, ActiveMaskCoversTheTone) {
    ActiveLevelEstimator::Config cfg;
    cfg.keepEnvelope = true;
    const Samples x = concat(sine(400.0, 0.5, 2.0, kFs), silence(2.0, kFs));
    const auto r = ActiveLevelEstimator(cfg).estimate(x, kFs);
    ASSERT_EQ(r.status, LevelStatus::Ok);

    const auto mask = activeMask(r);
    ASSERT_EQ(mask.size(), x.size());
    EXPECT_TRUE(mask[static_cast<std::size_t>(kFs)]);           // middle of the tone
    EXPECT_FALSE(mask[static_cast<std::size_t>(3.5 * kFs)]);    // deep in the pause
}

TEST(ActiveLevelTest, RepeatedEstimatesAreIdentical) {
    const Samples x = concat(sine(180.0, 0.6, 0.8, kFs), concat(silence(0.3, kFs), sine(900.0, 0.2, 0.8, kFs)));
    const ActiveLevelEstimator est;
    const auto a = est.estimate(x, kFs);
    const auto b = est.estimate(x, kFs);
    EXPECT_EQ(a.activeLevelDb, b.activeLevelDb);
    EXPECT_EQ(a.activityFraction, b.activityFraction);
    EXPECT_EQ(a.activeThreshold, b.activeThreshold);
    EXPECT_EQ(a.diagnostics.thresholds, b.diagnostics.thresholds);
    EXPECT_EQ(a.diagnostics.activityCounts, b.diagnostics.activityCounts);
    EXPECT_EQ(a.diagnostics.deltas, b.diagnostics.deltas);
}
