#include "audio/wav_file.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace aslmix {

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

std::uint16_t read_u16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

void put_u16(std::ofstream& f, std::uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    f.write(b, 2);
}

void put_u32(std::ofstream& f, std::uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                       static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    f.write(b, 4);
}

double decode_sample(const std::uint8_t* p, int bits, bool isFloat) {
    if (isFloat) {
        if (bits == 32) {
            float v;
            std::memcpy(&v, p, 4);
            return v;
        }
        double v;
        std::memcpy(&v, p, 8);
        return v;
    }
    switch (bits) {
        case 8:
            return (static_cast<int>(p[0]) - 128) / 128.0;
        case 16:
            return static_cast<std::int16_t>(read_u16(p)) / 32768.0;
        case 24: {
            std::int32_t raw = p[0] | (p[1] << 8) | (p[2] << 16);
            if (raw & 0x800000) raw |= static_cast<std::int32_t>(0xFF000000);
            return raw / 8388608.0;
        }
        default:
            return static_cast<std::int32_t>(read_u32(p)) / 2147483648.0;
    }
}

} // namespace

WavAudio readWavMono(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open WAV file: " + path);
    }

    f.seekg(0, std::ios::end);
    const std::streamoff fileSize = f.tellg();
    f.seekg(0, std::ios::beg);
    // Declared chunk sizes are not trusted beyond what the file holds.
    auto bytesLeft = [&f, fileSize]() -> std::uint32_t {
        const std::streamoff left = fileSize - f.tellg();
        return left > 0 ? static_cast<std::uint32_t>(std::min<std::streamoff>(left, 0xFFFFFFFF)) : 0u;
    };

    std::uint8_t hdr[12];
    if (!f.read(reinterpret_cast<char*>(hdr), 12) ||
        std::memcmp(hdr, "RIFF", 4) != 0 || std::memcmp(hdr + 8, "WAVE", 4) != 0) {
        throw std::runtime_error("Not a RIFF/WAVE file: " + path);
    }

    WavAudio wav;
    std::uint16_t format = 0;
    bool haveFmt = false;
    std::vector<std::uint8_t> data;
    bool haveData = false;

    std::uint8_t chunk[8];
    while (f.read(reinterpret_cast<char*>(chunk), 8)) {
        const std::uint32_t size = read_u32(chunk + 4);
        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || size > bytesLeft()) {
                throw std::runtime_error("Malformed fmt chunk: " + path);
            }
            std::vector<std::uint8_t> fmt(size);
            if (!f.read(reinterpret_cast<char*>(fmt.data()), size)) break;
            format = read_u16(fmt.data());
            wav.channels = read_u16(fmt.data() + 2);
            wav.sampleRate = static_cast<int>(read_u32(fmt.data() + 4));
            wav.bitsPerSample = read_u16(fmt.data() + 14);
            if (format == kFormatExtensible && size >= 26) {
                format = read_u16(fmt.data() + 24);  // sub-format GUID starts with the tag
            }
            haveFmt = true;
            if (size & 1u) f.ignore(1);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data.resize(std::min(size, bytesLeft()));
            f.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            data.resize(static_cast<std::size_t>(f.gcount()));
            haveData = true;
            break;
        } else {
            f.ignore((static_cast<std::streamsize>(size) + 1) & ~std::streamsize{1});
        }
    }

    if (!haveFmt || !haveData) {
        throw std::runtime_error("Missing fmt or data chunk: " + path);
    }
    wav.isFloat = (format == kFormatFloat);
    const bool intOk = (format == kFormatPcm) &&
        (wav.bitsPerSample == 8 || wav.bitsPerSample == 16 ||
         wav.bitsPerSample == 24 || wav.bitsPerSample == 32);
    const bool floatOk = wav.isFloat && (wav.bitsPerSample == 32 || wav.bitsPerSample == 64);
    if (!(intOk || floatOk) || wav.channels < 1 || wav.sampleRate <= 0) {
        throw std::runtime_error("Unsupported WAV format in " + path + " (format " +
                                 std::to_string(format) + ", " +
                                 std::to_string(wav.bitsPerSample) + " bit)");
    }

    const std::size_t bytes = static_cast<std::size_t>(wav.bitsPerSample / 8);
    const std::size_t frameBytes = bytes * static_cast<std::size_t>(wav.channels);
    const std::size_t frames = data.size() / frameBytes;

    wav.samples.resize(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        const std::uint8_t* frame = data.data() + i * frameBytes;
        double sum = 0.0;
        for (int ch = 0; ch < wav.channels; ++ch) {
            sum += decode_sample(frame + static_cast<std::size_t>(ch) * bytes,
                                 wav.bitsPerSample, wav.isFloat);
        }
        wav.samples[i] = sum / wav.channels;
    }
    return wav;
}

void writeWavPcm16(const std::string& path, const Samples& samples, int sampleRate) {
    if (sampleRate <= 0) {
        throw std::runtime_error("Invalid sample rate for " + path);
    }
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot create WAV file: " + path);
    }

    const std::uint32_t dataBytes = static_cast<std::uint32_t>(samples.size() * 2);
    f.write("RIFF", 4);
    put_u32(f, 36 + dataBytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put_u32(f, 16);
    put_u16(f, kFormatPcm);
    put_u16(f, 1);
    put_u32(f, static_cast<std::uint32_t>(sampleRate));
    put_u32(f, static_cast<std::uint32_t>(sampleRate) * 2);
    put_u16(f, 2);
    put_u16(f, 16);
    f.write("data", 4);
    put_u32(f, dataBytes);

    for (double s : samples) {
        const double clamped = std::clamp(s, -1.0, 1.0);
        put_u16(f, static_cast<std::uint16_t>(static_cast<std::int16_t>(std::lround(clamped * 32767.0))));
    }
    if (!f) {
        throw std::runtime_error("Failed writing WAV file: " + path);
    }
}

} // namespace aslmix
