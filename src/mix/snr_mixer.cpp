#include "mix/snr_mixer.hpp"
#include "level/level_error.hpp"
#include <algorithm>
#include <cmath>

namespace aslmix {

Samples matchNoiseLength(const Samples& noise, std::size_t length, std::size_t offset) {
    if (noise.empty()) {
        throw LevelError(ErrorCode::InvalidInput, "mix: empty noise signal");
    }
    Samples out(length);
    if (noise.size() < length) {
        for (std::size_t i = 0; i < length; ++i) {
            out[i] = noise[i % noise.size()];
        }
    } else {
        const std::size_t start = std::min(offset, noise.size() - length);
        std::copy_n(noise.begin() + static_cast<std::ptrdiff_t>(start), length, out.begin());
    }
    return out;
}

Samples matchNoiseLength(const Samples& noise, std::size_t length, std::mt19937_64& rng) {
    std::size_t offset = 0;
    if (noise.size() > length) {
        std::uniform_int_distribution<std::size_t> pick(0, noise.size() - length);
        offset = pick(rng);
    }
    return matchNoiseLength(noise, length, offset);
}

double achievedSnrDb(double speechPower, double gain, double noisePower) {
    return 10.0 * std::log10(speechPower / (gain * gain * noisePower));
}

SnrMixer::SnrMixer(const MixSpec& spec) : spec_(spec) {
    if (!std::isfinite(spec_.targetSnrDb)) {
        throw LevelError(ErrorCode::InvalidInput, "mix: target SNR must be finite");
    }
}

MixResult SnrMixer::mix(const Samples& speech, const Samples& noise, double sampleRate,
                        std::mt19937_64& rng, const LevelResult* speechLevel) const {
    if (speech.empty()) {
        throw LevelError(ErrorCode::EmptySignal, "mix: empty speech signal");
    }
    if (!(sampleRate > 0.0)) {
        throw LevelError(ErrorCode::InvalidInput, "mix: sample rate must be positive");
    }
    if (!all_finite(speech) || !all_finite(noise)) {
        throw LevelError(ErrorCode::InvalidInput, "mix: non-finite samples");
    }
    return mixMatched(speech, matchNoiseLength(noise, speech.size(), rng), speechLevel);
}

MixResult SnrMixer::mixMatched(const Samples& speech, const Samples& noise,
                               const LevelResult* speechLevel) const {
    MixResult r;
    if (spec_.useActiveSpeech && speechLevel && speechLevel->hasActiveLevel()) {
        const double level = speechLevel->diagnostics.activeLevelLinear;
        r.speechPower = level * level;
        r.usedActiveLevel = true;
    } else {
        r.speechPower = mean_square(speech);
    }

    r.noisePower = mean_square(noise);
    if (!(r.noisePower > 0.0)) {
        throw LevelError(ErrorCode::ZeroPowerNoise, "mix: noise signal has zero power");
    }

    const double targetNoisePower = r.speechPower / std::pow(10.0, spec_.targetSnrDb / 10.0);
    r.appliedGain = std::sqrt(targetNoisePower / r.noisePower);

    r.mixed.resize(speech.size());
    for (std::size_t i = 0; i < speech.size(); ++i) {
        r.mixed[i] = speech[i] + r.appliedGain * noise[i];
    }

    const double peak = peak_abs(r.mixed);
    if (peak > 1.0) {
        r.clipped = true;
        r.normalization = 1.0 / peak;
        for (double& s : r.mixed) s /= peak;
    }
    return r;
}

} // namespace aslmix
