#include "level/threshold_ladder.hpp"
#include "level/level_error.hpp"
#include <cmath>

namespace aslmix {

std::vector<double> buildThresholdLadder(double cMax, double ratio, int levels) {
    if (levels < 1 || !(ratio > 1.0) || !std::isfinite(ratio)) {
        throw LevelError(ErrorCode::InvalidInput,
                         "threshold ladder: need levels >= 1 and ratio > 1");
    }
    if (!(cMax > 0.0)) {
        throw LevelError(ErrorCode::DegenerateSignal, "threshold ladder: no envelope energy");
    }

    std::vector<double> c(static_cast<std::size_t>(levels));
    for (int j = 0; j < levels; ++j) {
        c[static_cast<std::size_t>(j)] = cMax / std::pow(ratio, levels - 1 - j);
    }
    return c;
}

std::vector<double> buildFixedLadder(int bitDepth) {
    if (bitDepth < 2) {
        throw LevelError(ErrorCode::InvalidInput, "fixed ladder: bit depth must be at least 2");
    }
    const int n = bitDepth - 1;
    std::vector<double> c(static_cast<std::size_t>(n));
    for (int j = 0; j < n; ++j) {
        c[static_cast<std::size_t>(j)] = std::ldexp(1.0, j - n);
    }
    return c;
}

ActivityProfile profileActivity(const Samples& smoothed, const std::vector<double>& thresholds) {
    ActivityProfile prof;
    prof.counts.assign(thresholds.size(), 0);
    prof.fractions.assign(thresholds.size(), 0.0);
    if (smoothed.empty()) return prof;

    for (std::size_t j = 0; j < thresholds.size(); ++j) {
        const double c = thresholds[j];
        std::size_t n = 0;
        for (double v : smoothed) {
            if (v >= c) ++n;
        }
        prof.counts[j] = n;
        prof.fractions[j] = static_cast<double>(n) / static_cast<double>(smoothed.size());
    }
    return prof;
}

} // namespace aslmix
