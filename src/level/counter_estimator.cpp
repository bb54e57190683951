#include "level/counter_estimator.hpp"
#include "level/envelope.hpp"
#include "level/hangover.hpp"
#include "level/level_error.hpp"
#include "level/threshold_ladder.hpp"
#include <cmath>

namespace aslmix {

CounterLevelEstimator::CounterLevelEstimator(const Config& config) : config_(config) {
    if (config_.bitDepth < 2 || !(config_.timeConstant > 0.0) || config_.hangover < 0.0) {
        throw LevelError(ErrorCode::InvalidInput, "counter estimator: invalid configuration");
    }
}

CounterLevelEstimator::Bracket CounterLevelEstimator::bisect(Bracket upper, Bracket lower,
                                                             double marginDb, double tolerance) {
    tolerance = std::abs(tolerance);
    if (std::abs(upper.activityDb - upper.thresholdDb - marginDb) < tolerance) return upper;
    if (std::abs(lower.activityDb - lower.thresholdDb - marginDb) < tolerance) return lower;

    Bracket mid{(upper.activityDb + lower.activityDb) / 2.0,
                (upper.thresholdDb + lower.thresholdDb) / 2.0};
    int iteration = 1;
    while (true) {
        const double diff = mid.activityDb - mid.thresholdDb - marginDb;
        if (std::abs(diff) <= tolerance) break;
        if (++iteration > 20) tolerance *= 1.1;

        if (diff > tolerance) {
            mid.activityDb = (upper.activityDb + mid.activityDb) / 2.0;
            mid.thresholdDb = (upper.thresholdDb + mid.thresholdDb) / 2.0;
        } else if (diff < -tolerance) {
            mid.activityDb = (mid.activityDb + lower.activityDb) / 2.0;
            mid.thresholdDb = (mid.thresholdDb + lower.thresholdDb) / 2.0;
        }
    }
    return mid;
}

LevelResult CounterLevelEstimator::estimate(const Samples& signal, double sampleRate) const {
    if (signal.empty()) {
        throw LevelError(ErrorCode::EmptySignal, "counter estimator: empty signal");
    }
    if (!(sampleRate > 0.0) || !all_finite(signal)) {
        throw LevelError(ErrorCode::InvalidInput, "counter estimator: invalid input");
    }

    LevelResult result;
    auto& diag = result.diagnostics;
    diag.meanSquare = mean_square(signal);
    if (diag.meanSquare == 0.0) return result;

    diag.thresholds = buildFixedLadder(config_.bitDepth);
    const std::size_t n = diag.thresholds.size();
    const std::size_t hangMax = hangoverWindow(sampleRate, config_.hangover);
    const Samples q = extractEnvelope(signal, sampleRate, config_.timeConstant);

    std::vector<std::size_t> counts(n, 0);
    std::vector<std::size_t> hang(n, hangMax);
    for (double v : q) {
        for (std::size_t j = 0; j < n; ++j) {
            if (v >= diag.thresholds[j]) {
                ++counts[j];
                hang[j] = 0;
            } else if (hang[j] < hangMax) {
                ++counts[j];
                ++hang[j];
            } else {
                break;
            }
        }
    }

    diag.activityCounts = counts;
    diag.activityFractions.resize(n);
    for (std::size_t j = 0; j < n; ++j) {
        diag.activityFractions[j] = static_cast<double>(counts[j]) / static_cast<double>(q.size());
    }
    if (counts[0] == 0) return result;

    const double totalPower = diag.meanSquare * static_cast<double>(signal.size());
    std::vector<double> aDb(n), cDb(n);
    diag.deltas.resize(n);
    for (std::size_t j = 0; j < n; ++j) {
        aDb[j] = 10.0 * std::log10(totalPower / (static_cast<double>(counts[j]) + 1e-10));
        cDb[j] = 20.0 * std::log10(diag.thresholds[j] + 1e-10);
        diag.deltas[j] = aDb[j] - cDb[j];
    }

    result.status = LevelStatus::NoCrossing;
    if (diag.deltas[0] < config_.marginDb) return result;

    for (std::size_t j = 1; j < n; ++j) {
        if (counts[j] == 0) break;
        if (diag.deltas[j] > config_.marginDb) continue;

        const Bracket hit = bisect({aDb[j], cDb[j]}, {aDb[j - 1], cDb[j - 1]},
                                   config_.marginDb, config_.toleranceDb);
        const double activePower = std::pow(10.0, hit.activityDb / 10.0);

        diag.crossingIndex = j;
        diag.interpolated = true;
        diag.activeLevelLinear = std::sqrt(activePower);

        result.status = LevelStatus::Ok;
        result.activeLevelDb = hit.activityDb;
        result.activityFraction = diag.meanSquare / activePower;
        result.activeThreshold = std::pow(10.0, hit.thresholdDb / 20.0);
        return result;
    }
    return result;
}

} // namespace aslmix
