#pragma once
#include "level/active_level.hpp"
#include "level/signal_stats.hpp"
#include <cstddef>
#include <random>

namespace aslmix {

struct MixSpec {
    double targetSnrDb = 10.0;
    bool useActiveSpeech = true;
};

struct MixResult {
    Samples mixed;
    double appliedGain{0.0};     // linear gain applied to the noise
    bool clipped{false};         // peak normalization was applied
    double normalization{1.0};   // 1/peak when clipped, else 1
    double speechPower{0.0};     // Ps used for the gain
    double noisePower{0.0};      // Pn0 of the length-matched noise
    bool usedActiveLevel{false};
};

// Tiles a short noise to length, or cuts a window starting at offset from a
// longer one. The offset is clamped to the last valid start.
Samples matchNoiseLength(const Samples& noise, std::size_t length, std::size_t offset);

// Same, with the window offset drawn uniformly from rng.
Samples matchNoiseLength(const Samples& noise, std::size_t length, std::mt19937_64& rng);

// SNR of speech power against gain^2 * noise power, in dB.
double achievedSnrDb(double speechPower, double gain, double noisePower);

class SnrMixer {
public:
    explicit SnrMixer(const MixSpec& spec);

    // Mixes noise into speech at the target SNR. speechLevel, when it carries
    // an active level and useActiveSpeech is set, gives the speech power; the
    // mean power of the speech is used otherwise.
    // Throws LevelError: EmptySignal, InvalidInput, ZeroPowerNoise.
    MixResult mix(const Samples& speech, const Samples& noise, double sampleRate,
                  std::mt19937_64& rng, const LevelResult* speechLevel = nullptr) const;

    const MixSpec& spec() const { return spec_; }

private:
    MixResult mixMatched(const Samples& speech, const Samples& noise,
                         const LevelResult* speechLevel) const;

    MixSpec spec_;
};

} // namespace aslmix
