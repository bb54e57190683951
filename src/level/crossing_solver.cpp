#include "level/crossing_solver.hpp"
#include "level/level_error.hpp"
#include <algorithm>
#include <cmath>

namespace aslmix {

namespace {
constexpr double kEps = 1e-300;
}

CrossingSolution solveCrossing(double meanSquare,
                               const std::vector<double>& thresholds,
                               const std::vector<double>& activity,
                               double marginDb) {
    if (thresholds.size() != activity.size()) {
        throw LevelError(ErrorCode::InvalidInput, "crossing: threshold/activity size mismatch");
    }

    CrossingSolution sol;
    if (!(meanSquare > 0.0)) return sol;

    const double m = std::pow(10.0, marginDb / 10.0);
    const double mLn = std::log(m);

    double prevDelta = 0.0;
    double prevALn = 0.0;
    for (std::size_t j = 0; j < thresholds.size(); ++j) {
        if (activity[j] == 0.0) break;

        const double aLn = std::log(meanSquare / std::max(activity[j], kEps));
        const double cLn = 2.0 * std::log(std::max(thresholds[j], kEps));
        const double delta = aLn - cLn;
        sol.deltas.push_back(delta);

        if (delta <= mLn) {
            sol.found = true;
            sol.index = j;
            if (j == 0) {
                sol.activeLevel = std::exp(aLn / 2.0);
                sol.activeThreshold = thresholds[0];
                sol.activity = activity[0];
            } else {
                // prevDelta > mLn here, otherwise the scan would have stopped at j-1
                const double alpha = (mLn - prevDelta) / (delta - prevDelta);
                const double aLnInterp = prevALn + alpha * (aLn - prevALn);
                sol.interpolated = true;
                sol.activeLevel = std::exp(aLnInterp / 2.0);
                sol.activeThreshold = sol.activeLevel / std::sqrt(m);
                sol.activity = meanSquare / (m * sol.activeThreshold * sol.activeThreshold);
            }
            return sol;
        }
        prevDelta = delta;
        prevALn = aLn;
    }
    return sol;
}

} // namespace aslmix
