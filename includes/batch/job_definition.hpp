#pragma once

#include "level/active_level.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace aslmix {

using JsonValue = nlohmann::json;

// One corpus mixing job: every speech file against every noise file at every SNR.
class JobDefinition {
public:
    using ExtraMap = std::map<std::string, JsonValue>;

    bool loadFromFile(const std::string& filepath);
    bool loadFromJson(const JsonValue& json);
    JsonValue toJson() const;

    const std::string& getSpeechDir() const { return speechDir_; }
    const std::string& getNoiseDir() const { return noiseDir_; }
    const std::string& getOutputDir() const { return outputDir_; }
    const std::vector<double>& getSnrs() const { return snrs_; }
    std::uint64_t getSeed() const { return seed_; }
    std::optional<int> getWorkers() const { return workers_; }
    bool useActiveSpeech() const { return useActiveSpeech_; }
    const ActiveLevelEstimator::Config& getLevelConfig() const { return level_; }
    const std::optional<std::string>& getDbPath() const { return dbPath_; }
    const ExtraMap& getAdditionalData() const { return extra_; }

    void setSpeechDir(std::string dir) { speechDir_ = std::move(dir); }
    void setNoiseDir(std::string dir) { noiseDir_ = std::move(dir); }
    void setOutputDir(std::string dir) { outputDir_ = std::move(dir); }
    void setSnrs(std::vector<double> snrs) { snrs_ = std::move(snrs); }
    void setSeed(std::uint64_t seed) { seed_ = seed; }
    void setWorkers(int workers) { workers_ = workers; }
    void setUseActiveSpeech(bool use) { useActiveSpeech_ = use; }
    void setLevelConfig(const ActiveLevelEstimator::Config& cfg) { level_ = cfg; }
    void setDbPath(std::string path) { dbPath_ = std::move(path); }

    // True when the loaded JSON set the key. Level settings are named
    // "level.<key>", e.g. "level.margin_db".
    bool isExplicit(const std::string& key) const { return explicitKeys_.count(key) > 0; }

    // Required directories present and numeric settings in range.
    bool isValid(std::string* why = nullptr) const;

private:
    std::string speechDir_;
    std::string noiseDir_;
    std::string outputDir_;
    std::vector<double> snrs_{0.0, 5.0, 10.0, 15.0};
    std::uint64_t seed_{0};
    std::optional<int> workers_;
    bool useActiveSpeech_{true};
    ActiveLevelEstimator::Config level_;
    std::optional<std::string> dbPath_;
    ExtraMap extra_;
    std::set<std::string> explicitKeys_;

    void parseFromJson(const JsonValue& json);
    void parseLevelFromJson(const JsonValue& json);
};

} // namespace aslmix
