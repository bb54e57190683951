#include "level/envelope.hpp"
#include "level/level_error.hpp"
#include "test_signals.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

using namespace aslmix;

TEST(EnvelopeTest, EmptyInputIsInvalid) {
    try {
        extractEnvelope({}, 16000.0);
        FAIL() << "expected LevelError";
    } catch (const LevelError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
    }
}

TEST(EnvelopeTest, RejectsNonPositiveRateAndTimeConstant) {
    const Samples x{0.5, 0.5};
    EXPECT_THROW(extractEnvelope(x, 0.0), LevelError);
    EXPECT_THROW(extractEnvelope(x, 16000.0, 0.0), LevelError);
    EXPECT_THROW(extractEnvelope(x, -8000.0), LevelError);
}

TEST(EnvelopeTest, FollowsDoubleExponentialRecurrence) {
    const double fs = 8000.0;
    const double T = 0.03;
    const double g = std::exp(-1.0 / (fs * T));
    const Samples x{1.0, -0.5, 0.25, 0.0};

    const Samples q = extractEnvelope(x, fs, T);
    ASSERT_EQ(q.size(), x.size());

    double p = 0.0, qq = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        p = g * p + (1.0 - g) * std::abs(x[i]);
        qq = g * qq + (1.0 - g) * p;
        EXPECT_DOUBLE_EQ(q[i], qq) << "at " << i;
    }
    EXPECT_DOUBLE_EQ(q[0], (1.0 - g) * (1.0 - g));
}

TEST(EnvelopeTest, ConvergesToMeanAbsoluteValue) {
    const Samples x(16000, -0.25);
    const Samples q = extractEnvelope(x, 16000.0);
    EXPECT_NEAR(q.back(), 0.25, 1e-9);
    for (std::size_t i = 1; i < q.size(); ++i) {
        ASSERT_GE(q[i], q[i - 1]);
    }
}

TEST(EnvelopeTest, SineEnvelopeIsNonNegativeAndNearRectifiedMean) {
    const Samples x = aslmix::testing::sine(440.0, 0.8, 1.0, 16000.0);
    const Samples q = extractEnvelope(x, 16000.0);
    for (double v : q) ASSERT_GE(v, 0.0);
    EXPECT_NEAR(q.back(), 0.8 * 2.0 / std::numbers::pi, 0.01);
}
