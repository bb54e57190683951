#pragma once
#include <cstddef>
#include <vector>

namespace aslmix {

struct CrossingSolution {
    bool found{false};
    bool interpolated{false};
    std::size_t index{0};        // first threshold index satisfying the margin
    double activeLevel{0.0};     // linear RMS of active speech
    double activeThreshold{0.0};
    double activity{0.0};
    std::vector<double> deltas;  // A_ln[j] - C_ln[j], up to the scan stop
};

// Finds where ln(Ex / a_j) - 2 ln(c_j) first drops to the margin ln(10^(M/10)),
// scanning thresholds upward and stopping at the first zero activity.
// A crossing between j-1 and j is linearly interpolated in the log domain.
CrossingSolution solveCrossing(double meanSquare,
                               const std::vector<double>& thresholds,
                               const std::vector<double>& activity,
                               double marginDb);

} // namespace aslmix
