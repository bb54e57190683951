#include "level/envelope.hpp"
#include "level/level_error.hpp"
#include <cmath>

namespace aslmix {

Samples extractEnvelope(const Samples& x, double sampleRate, double timeConstant) {
    if (x.empty()) {
        throw LevelError(ErrorCode::InvalidInput, "envelope: empty input");
    }
    if (!(sampleRate > 0.0) || !(timeConstant > 0.0)) {
        throw LevelError(ErrorCode::InvalidInput,
                         "envelope: sample rate and time constant must be positive");
    }

    const double g = std::exp(-1.0 / (sampleRate * timeConstant));
    const double oneMinusG = 1.0 - g;

    Samples q(x.size());
    double p = 0.0;
    double qPrev = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        p = g * p + oneMinusG * std::abs(x[i]);
        qPrev = g * qPrev + oneMinusG * p;
        q[i] = qPrev;
    }
    return q;
}

} // namespace aslmix
