#pragma once
#include "level/signal_stats.hpp"
#include <cstddef>
#include <vector>

namespace aslmix {

enum class LevelStatus {
    Ok,
    DegenerateSignal,  // zero energy or zero envelope peak
    NoCrossing         // no threshold satisfied the margin
};

const char* toString(LevelStatus status);

struct LevelDiagnostics {
    double meanSquare{0.0};            // Ex
    double activeLevelLinear{0.0};     // RMS of active speech, sample units
    std::vector<double> thresholds;
    std::vector<std::size_t> activityCounts;
    std::vector<double> activityFractions;
    std::vector<double> deltas;
    std::size_t crossingIndex{0};
    bool interpolated{false};
    Samples smoothedEnvelope;
};

struct LevelResult {
    double activeLevelDb{-INFINITY};
    double activityFraction{0.0};
    double activeThreshold{0.0};
    LevelStatus status{LevelStatus::DegenerateSignal};
    LevelDiagnostics diagnostics;

    bool hasActiveLevel() const { return status == LevelStatus::Ok; }
};

// ITU-T P.56 method B active speech level.
class ActiveLevelEstimator {
public:
    struct Config {
        double timeConstant = 0.03;  // T, seconds
        double hangover = 0.2;       // H, seconds
        double marginDb = 15.9;      // M
        double ratio = 2.0;          // b
        int levels = 30;
        bool keepEnvelope = false;   // retain the smoothed envelope in diagnostics
    };

    ActiveLevelEstimator() = default;
    explicit ActiveLevelEstimator(const Config& config);

    // Throws LevelError(EmptySignal) for an empty signal and
    // LevelError(InvalidInput) for non-finite samples or a bad sample rate.
    LevelResult estimate(const Samples& signal, double sampleRate) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

// Samples whose smoothed envelope reaches the active threshold.
// Requires a result estimated with keepEnvelope.
std::vector<bool> activeMask(const LevelResult& result);

} // namespace aslmix
