#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace aslmix {

using Samples = std::vector<double>;

inline double mean_square(const Samples& x) {
    if (x.empty()) return 0.0;
    double acc = 0.0;
    for (double s : x) acc += s * s;
    return acc / static_cast<double>(x.size());
}

inline double peak_abs(const Samples& x) {
    double peak = 0.0;
    for (double s : x) peak = std::max(peak, std::abs(s));
    return peak;
}

inline bool all_finite(const Samples& x) {
    for (double s : x) {
        if (!std::isfinite(s)) return false;
    }
    return true;
}

inline double power_to_db(double power) {
    return (power > 0.0) ? 10.0 * std::log10(power) : -INFINITY;
}

} // namespace aslmix
