#include "level/active_level.hpp"
#include "level/crossing_solver.hpp"
#include "level/envelope.hpp"
#include "level/hangover.hpp"
#include "level/level_error.hpp"
#include "level/threshold_ladder.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace aslmix {

const char* toString(LevelStatus status) {
    switch (status) {
        case LevelStatus::Ok:               return "ok";
        case LevelStatus::DegenerateSignal: return "degenerate_signal";
        case LevelStatus::NoCrossing:       return "no_crossing";
    }
    return "unknown";
}

ActiveLevelEstimator::ActiveLevelEstimator(const Config& config) : config_(config) {
    if (!(config_.timeConstant > 0.0) || !(config_.hangover >= 0.0) ||
        !(config_.ratio > 1.0) || config_.levels < 1 || !std::isfinite(config_.marginDb)) {
        throw LevelError(ErrorCode::InvalidInput, "active level: invalid configuration");
    }
}

LevelResult ActiveLevelEstimator::estimate(const Samples& signal, double sampleRate) const {
    if (signal.empty()) {
        throw LevelError(ErrorCode::EmptySignal, "active level: empty signal");
    }
    if (!(sampleRate > 0.0) || !std::isfinite(sampleRate)) {
        throw LevelError(ErrorCode::InvalidInput, "active level: sample rate must be positive");
    }
    if (!all_finite(signal)) {
        throw LevelError(ErrorCode::InvalidInput, "active level: non-finite samples");
    }

    LevelResult result;
    auto& diag = result.diagnostics;
    diag.meanSquare = mean_square(signal);
    if (diag.meanSquare == 0.0) {
        return result;
    }

    const Samples envelope = extractEnvelope(signal, sampleRate, config_.timeConstant);
    Samples smoothed = applyHangover(envelope, hangoverWindow(sampleRate, config_.hangover));
    const double cMax = *std::max_element(smoothed.begin(), smoothed.end());

    try {
        diag.thresholds = buildThresholdLadder(cMax, config_.ratio, config_.levels);
    } catch (const LevelError& e) {
        if (e.code() != ErrorCode::DegenerateSignal) throw;
        return result;
    }

    ActivityProfile profile = profileActivity(smoothed, diag.thresholds);
    CrossingSolution sol = solveCrossing(diag.meanSquare, diag.thresholds,
                                         profile.fractions, config_.marginDb);

    diag.activityCounts = std::move(profile.counts);
    diag.activityFractions = std::move(profile.fractions);
    diag.deltas = std::move(sol.deltas);
    if (config_.keepEnvelope) {
        diag.smoothedEnvelope = std::move(smoothed);
    }

    if (!sol.found) {
        result.status = LevelStatus::NoCrossing;
        return result;
    }

    diag.crossingIndex = sol.index;
    diag.interpolated = sol.interpolated;
    diag.activeLevelLinear = sol.activeLevel;

    result.status = LevelStatus::Ok;
    result.activeLevelDb = 20.0 * std::log10(sol.activeLevel + 1e-300);
    result.activityFraction = sol.activity;
    result.activeThreshold = sol.activeThreshold;
    return result;
}

std::vector<bool> activeMask(const LevelResult& result) {
    const auto& env = result.diagnostics.smoothedEnvelope;
    std::vector<bool> mask(env.size(), false);
    if (!result.hasActiveLevel()) return mask;
    for (std::size_t i = 0; i < env.size(); ++i) {
        mask[i] = env[i] >= result.activeThreshold;
    }
    return mask;
}

} // namespace aslmix
