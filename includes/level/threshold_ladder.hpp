#pragma once
#include "level/signal_stats.hpp"
#include <cstddef>
#include <vector>

namespace aslmix {

// Geometric thresholds c_j = cMax / ratio^(levels-1-j), j = 0..levels-1.
// The last threshold equals cMax exactly.
// Throws LevelError(DegenerateSignal) when cMax <= 0, InvalidInput when
// ratio <= 1 or levels < 1.
std::vector<double> buildThresholdLadder(double cMax, double ratio, int levels);

// Absolute full-scale ladder 2^-(bitDepth-1) .. 2^-1 (bitDepth - 1 values).
std::vector<double> buildFixedLadder(int bitDepth);

struct ActivityProfile {
    std::vector<std::size_t> counts;  // samples with smoothed >= c_j
    std::vector<double> fractions;    // counts / N
};

// Per-threshold activity of a smoothed envelope. Fractions are non-increasing
// whenever the thresholds are increasing.
ActivityProfile profileActivity(const Samples& smoothed, const std::vector<double>& thresholds);

} // namespace aslmix
