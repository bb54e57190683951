#include "batch/batch_runner.hpp"
#include "audio/wav_file.hpp"
#include "level/level_error.hpp"
#include "mix/snr_mixer.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace aslmix {

namespace fs = std::filesystem;

namespace {

bool has_wav_extension(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wav";
}

std::string format_snr(double snrDb) {
    std::ostringstream os;
    os << snrDb;
    return os.str();
}

} // namespace

BatchRunner::BatchRunner(const JobDefinition& job) : job_(job) {}

std::vector<fs::path> BatchRunner::listWavFiles(const std::string& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && has_wav_extension(entry.path())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot list directory " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string BatchRunner::outputPathFor(const std::string& outputDir, const fs::path& speech,
                                       const fs::path& noise, double snrDb) {
    const std::string snr = format_snr(snrDb) + "dB";
    const std::string name = speech.stem().string() + "__" + noise.stem().string() + "__" + snr + ".wav";
    return (fs::path(outputDir) / snr / name).string();
}

std::uint64_t BatchRunner::pairSeed(std::uint64_t seed, std::size_t speechIndex,
                                    std::size_t noiseIndex, std::size_t snrIndex) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed), static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(speechIndex),
                      static_cast<std::uint32_t>(noiseIndex),
                      static_cast<std::uint32_t>(snrIndex)};
    std::uint32_t out[2];
    seq.generate(out, out + 2);
    return (static_cast<std::uint64_t>(out[0]) << 32) | out[1];
}

BatchReport BatchRunner::run() {
    BatchReport report;
    stopRequested_.store(false);
    donePairs_.store(0);

    speechFiles_ = listWavFiles(job_.getSpeechDir());
    const auto noisePaths = listWavFiles(job_.getNoiseDir());
    if (speechFiles_.empty() || noisePaths.empty()) {
        std::cerr << "Warning: no .wav files in "
                  << (speechFiles_.empty() ? job_.getSpeechDir() : job_.getNoiseDir()) << std::endl;
        return report;
    }

    // Noise is decoded once and shared read-only by all workers.
    noise_.clear();
    noise_.reserve(noisePaths.size());
    for (const auto& path : noisePaths) {
        NoiseEntry entry;
        entry.path = path;
        try {
            WavAudio wav = readWavMono(path.string());
            entry.sampleRate = wav.sampleRate;
            entry.samples = std::move(wav.samples);
        } catch (const std::exception& e) {
            entry.error = e.what();
        }
        noise_.push_back(std::move(entry));
    }

    totalPairs_ = speechFiles_.size() * noise_.size() * job_.getSnrs().size();
    report.planned = totalPairs_;

    unsigned workers = job_.getWorkers()
        ? static_cast<unsigned>(*job_.getWorkers())
        : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min<unsigned>(workers, static_cast<unsigned>(speechFiles_.size()));

    std::atomic<std::size_t> next{0};
    std::vector<BatchReport> partial(workers);
    std::exception_ptr failure;
    std::mutex failureMutex;
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
        pool.emplace_back([this, &next, &partial, &failure, &failureMutex, w] {
            while (!stopRequested_.load()) {
                const std::size_t i = next.fetch_add(1);
                if (i >= speechFiles_.size()) break;
                try {
                    processSpeech(i, partial[w]);
                } catch (...) {
                    // Callback failures (e.g. the ledger) end the run; rethrown after join.
                    {
                        std::lock_guard<std::mutex> lock(failureMutex);
                        if (!failure) failure = std::current_exception();
                    }
                    requestStop();
                }
            }
        });
    }
    for (auto& t : pool) t.join();
    if (failure) std::rethrow_exception(failure);

    for (auto& p : partial) {
        report.written += p.written;
        report.clipped += p.clipped;
        report.skipped.insert(report.skipped.end(),
                              std::make_move_iterator(p.skipped.begin()),
                              std::make_move_iterator(p.skipped.end()));
    }
    report.cancelled = stopRequested_.load() && next.load() < speechFiles_.size();
    std::sort(report.skipped.begin(), report.skipped.end(),
              [](const SkippedPair& a, const SkippedPair& b) {
                  if (a.speechPath != b.speechPath) return a.speechPath < b.speechPath;
                  if (a.noisePath != b.noisePath) return a.noisePath < b.noisePath;
                  return a.snrDb < b.snrDb;
              });
    return report;
}

void BatchRunner::skip(BatchReport& local, SkippedPair pair) {
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (skipCallback_) skipCallback_(pair);
    }
    local.skipped.push_back(std::move(pair));
    pairDone();
}

void BatchRunner::pairDone() {
    const std::size_t done = donePairs_.fetch_add(1) + 1;
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (progressCallback_) progressCallback_(done, totalPairs_);
}

void BatchRunner::processSpeech(std::size_t speechIndex, BatchReport& local) {
    const fs::path& speechPath = speechFiles_[speechIndex];
    const auto& snrs = job_.getSnrs();

    auto skipAll = [&](const std::string& reason, const std::string& detail) {
        for (const auto& n : noise_) {
            for (double snr : snrs) {
                skip(local, {speechPath.string(), n.path.string(), snr, reason, detail});
            }
        }
    };

    WavAudio speech;
    try {
        speech = readWavMono(speechPath.string());
    } catch (const std::exception& e) {
        skipAll("read_error", e.what());
        return;
    }

    LevelResult level;
    try {
        level = ActiveLevelEstimator(job_.getLevelConfig()).estimate(speech.samples, speech.sampleRate);
    } catch (const LevelError& e) {
        skipAll(toString(e.code()), e.what());
        return;
    }

    {
        LevelRecord rec;
        rec.speechPath = speechPath.string();
        rec.sampleRate = speech.sampleRate;
        rec.numSamples = speech.samples.size();
        rec.activeLevelDb = level.activeLevelDb;
        rec.activityFraction = level.activityFraction;
        rec.activeThreshold = level.activeThreshold;
        rec.status = level.status;
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (levelCallback_) levelCallback_(rec);
    }

    for (std::size_t ni = 0; ni < noise_.size(); ++ni) {
        const NoiseEntry& noise = noise_[ni];
        for (std::size_t ki = 0; ki < snrs.size(); ++ki) {
            SkippedPair pair{speechPath.string(), noise.path.string(), snrs[ki], "", ""};
            if (!noise.error.empty()) {
                pair.reason = "read_error";
                pair.detail = noise.error;
                skip(local, std::move(pair));
                continue;
            }
            if (noise.sampleRate != speech.sampleRate) {
                pair.reason = "sample_rate_mismatch";
                pair.detail = std::to_string(speech.sampleRate) + " Hz vs " +
                              std::to_string(noise.sampleRate) + " Hz";
                skip(local, std::move(pair));
                continue;
            }

            MixResult mixed;
            try {
                std::mt19937_64 rng(pairSeed(job_.getSeed(), speechIndex, ni, ki));
                SnrMixer mixer({snrs[ki], job_.useActiveSpeech()});
                mixed = mixer.mix(speech.samples, noise.samples, speech.sampleRate, rng, &level);
            } catch (const LevelError& e) {
                pair.reason = toString(e.code());
                pair.detail = e.what();
                skip(local, std::move(pair));
                continue;
            }

            const std::string out = outputPathFor(job_.getOutputDir(), speechPath, noise.path, snrs[ki]);
            try {
                writeWavPcm16(out, mixed.mixed, speech.sampleRate);
            } catch (const std::exception& e) {
                pair.reason = "write_error";
                pair.detail = e.what();
                skip(local, std::move(pair));
                continue;
            }

            ++local.written;
            if (mixed.clipped) ++local.clipped;
            {
                MixRecord rec{speechPath.string(), noise.path.string(), snrs[ki], out,
                              mixed.appliedGain, mixed.clipped, mixed.usedActiveLevel};
                std::lock_guard<std::mutex> lock(callbackMutex_);
                if (mixCallback_) mixCallback_(rec);
            }
            pairDone();
        }
    }
}

} // namespace aslmix
