#include "level/hangover.hpp"
#include "level/level_error.hpp"
#include <cmath>
#include <deque>
#include <utility>

namespace aslmix {

std::size_t hangoverWindow(double sampleRate, double hangoverSeconds) {
    if (!(sampleRate > 0.0) || hangoverSeconds < 0.0 || !std::isfinite(hangoverSeconds)) {
        throw LevelError(ErrorCode::InvalidInput,
                         "hangover: sample rate must be positive and hangover non-negative");
    }
    return static_cast<std::size_t>(std::ceil(hangoverSeconds * sampleRate));
}

Samples applyHangover(const Samples& envelope, std::size_t window) {
    if (window < 1) return envelope;

    Samples out(envelope.size());
    // (value, index), values strictly decreasing from front to back
    std::deque<std::pair<double, std::size_t>> dq;

    for (std::size_t i = 0; i < envelope.size(); ++i) {
        const double v = envelope[i];
        while (!dq.empty() && dq.back().first <= v) {
            dq.pop_back();
        }
        dq.emplace_back(v, i);

        // drop entries with index < i - window + 1
        while (dq.front().second + window <= i) {
            dq.pop_front();
        }
        out[i] = dq.front().first;
    }
    return out;
}

} // namespace aslmix
