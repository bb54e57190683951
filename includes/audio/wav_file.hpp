#pragma once
#include "level/signal_stats.hpp"
#include <string>

namespace aslmix {

struct WavAudio {
    int sampleRate{0};
    int channels{0};        // channels in the file, before downmix
    int bitsPerSample{0};
    bool isFloat{false};
    Samples samples;        // mono, normalized to [-1, 1)
};

// Reads a RIFF/WAVE file as mono. Integer PCM is divided by 2^(bits-1),
// 8-bit is treated as unsigned; channels are averaged.
// Throws std::runtime_error on unreadable or unsupported files.
WavAudio readWavMono(const std::string& path);

// Writes 16-bit PCM mono, clamping to [-1, 1] and scaling by 32767.
// Creates missing parent directories.
void writeWavPcm16(const std::string& path, const Samples& samples, int sampleRate);

} // namespace aslmix
