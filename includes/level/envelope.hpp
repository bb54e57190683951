#pragma once
#include "level/signal_stats.hpp"

namespace aslmix {

// Double exponential smoothing of |x| with time constant T (seconds):
//   p[i] = g*p[i-1] + (1-g)*|x[i]|
//   q[i] = g*q[i-1] + (1-g)*p[i],   g = exp(-1/(fs*T))
// Returns q. Throws LevelError(InvalidInput) on empty input or bad parameters.
Samples extractEnvelope(const Samples& x, double sampleRate, double timeConstant = 0.03);

} // namespace aslmix
