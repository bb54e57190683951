#pragma once

#include "batch/job_definition.hpp"
#include "level/active_level.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace aslmix {

struct LevelRecord {
    std::string speechPath;
    int sampleRate{0};
    std::size_t numSamples{0};
    double activeLevelDb{0.0};
    double activityFraction{0.0};
    double activeThreshold{0.0};
    LevelStatus status{LevelStatus::DegenerateSignal};
};

struct MixRecord {
    std::string speechPath;
    std::string noisePath;
    double snrDb{0.0};
    std::string outputPath;
    double gain{0.0};
    bool clipped{false};
    bool usedActiveLevel{false};
};

struct SkippedPair {
    std::string speechPath;
    std::string noisePath;
    double snrDb{0.0};
    std::string reason;   // reason code, e.g. "sample_rate_mismatch"
    std::string detail;
};

struct BatchReport {
    std::size_t planned{0};
    std::size_t written{0};
    std::size_t clipped{0};
    std::vector<SkippedPair> skipped;
    bool cancelled{false};
};

class BatchRunner {
public:
    using LevelCallback = std::function<void(const LevelRecord&)>;
    using MixCallback = std::function<void(const MixRecord&)>;
    using SkipCallback = std::function<void(const SkippedPair&)>;
    using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

    explicit BatchRunner(const JobDefinition& job);

    // Callbacks run on worker threads, one at a time.
    void setLevelCallback(LevelCallback callback) { levelCallback_ = std::move(callback); }
    void setMixCallback(MixCallback callback) { mixCallback_ = std::move(callback); }
    void setSkipCallback(SkipCallback callback) { skipCallback_ = std::move(callback); }
    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    // Blocks until every speech file is processed or a stop is requested.
    // An exception thrown by a callback stops the workers and is rethrown here
    // once they have joined.
    BatchReport run();

    // Workers finish their current speech file and take no new ones.
    void requestStop() { stopRequested_.store(true); }

    static std::vector<std::filesystem::path> listWavFiles(const std::string& dir);
    static std::string outputPathFor(const std::string& outputDir,
                                     const std::filesystem::path& speech,
                                     const std::filesystem::path& noise,
                                     double snrDb);
    static std::uint64_t pairSeed(std::uint64_t seed, std::size_t speechIndex,
                                  std::size_t noiseIndex, std::size_t snrIndex);

private:
    struct NoiseEntry {
        std::filesystem::path path;
        int sampleRate{0};
        Samples samples;
        std::string error;  // non-empty when the file could not be read
    };

    void processSpeech(std::size_t speechIndex, BatchReport& local);
    void skip(BatchReport& local, SkippedPair pair);
    void pairDone();

    const JobDefinition& job_;
    std::vector<std::filesystem::path> speechFiles_;
    std::vector<NoiseEntry> noise_;

    std::atomic<bool> stopRequested_{false};
    std::atomic<std::size_t> donePairs_{0};
    std::size_t totalPairs_{0};
    std::mutex callbackMutex_;

    LevelCallback levelCallback_;
    MixCallback mixCallback_;
    SkipCallback skipCallback_;
    ProgressCallback progressCallback_;
};

} // namespace aslmix
