#pragma once
#include "level/active_level.hpp"

namespace aslmix {

// Bit-depth driven P.56 variant: a fixed full-scale threshold ladder,
// per-threshold hangover counters and a bisection refinement of the crossing.
// Costs O(N * thresholds); used to cross-check ActiveLevelEstimator.
class CounterLevelEstimator {
public:
    struct Config {
        int bitDepth = 16;
        double timeConstant = 0.03;
        double hangover = 0.2;
        double marginDb = 15.9;
        double toleranceDb = 0.5;  // bisection tolerance
    };

    CounterLevelEstimator() = default;
    explicit CounterLevelEstimator(const Config& config);

    LevelResult estimate(const Samples& signal, double sampleRate) const;

private:
    struct Bracket {
        double activityDb;
        double thresholdDb;
    };
    static Bracket bisect(Bracket upper, Bracket lower, double marginDb, double tolerance);

    Config config_;
};

} // namespace aslmix
