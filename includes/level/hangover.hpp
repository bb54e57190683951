#pragma once
#include "level/signal_stats.hpp"
#include <cstddef>

namespace aslmix {

// Hangover length in samples: ceil(H * fs).
std::size_t hangoverWindow(double sampleRate, double hangoverSeconds);

// Trailing sliding-window maximum: out[i] = max(env[i-window+1 .. i]).
// Runs in O(N) with a monotonic deque. A window below 1 returns env unchanged.
Samples applyHangover(const Samples& envelope, std::size_t window);

} // namespace aslmix
