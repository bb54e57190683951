#include "batch/job_definition.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>

namespace aslmix {

bool JobDefinition::loadFromFile(const std::string& filepath) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "Failed to open job file: " << filepath << std::endl;
            return false;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return loadFromJson(nlohmann::json::parse(content));
    } catch (const std::exception& e) {
        std::cerr << "Error loading job definition " << filepath << ": " << e.what() << std::endl;
        return false;
    }
}

bool JobDefinition::loadFromJson(const JsonValue& json) {
    try {
        parseFromJson(json);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing job definition: " << e.what() << std::endl;
        return false;
    }
    std::string why;
    if (!isValid(&why)) {
        std::cerr << "Invalid job definition: " << why << std::endl;
        return false;
    }
    return true;
}

void JobDefinition::parseLevelFromJson(const JsonValue& json) {
    for (const char* key : {"time_constant", "hangover", "margin_db", "ratio", "levels"}) {
        if (json.contains(key)) explicitKeys_.insert(std::string("level.") + key);
    }
    level_.timeConstant = json.value("time_constant", level_.timeConstant);
    level_.hangover = json.value("hangover", level_.hangover);
    level_.marginDb = json.value("margin_db", level_.marginDb);
    level_.ratio = json.value("ratio", level_.ratio);
    level_.levels = json.value("levels", level_.levels);
}

void JobDefinition::parseFromJson(const JsonValue& json) {
    explicitKeys_.clear();
    speechDir_ = json.at("speech_dir").get<std::string>();
    noiseDir_ = json.at("noise_dir").get<std::string>();
    outputDir_ = json.at("output_dir").get<std::string>();

    if (json.contains("snr_db")) {
        snrs_ = json["snr_db"].get<std::vector<double>>();
    }
    seed_ = json.value("seed", seed_);
    if (json.contains("workers")) {
        workers_ = json["workers"].get<int>();
    }
    useActiveSpeech_ = json.value("use_active_speech", useActiveSpeech_);
    if (json.contains("level")) {
        parseLevelFromJson(json["level"]);
    }
    if (json.contains("db_path")) {
        dbPath_ = json["db_path"].get<std::string>();
    }

    extra_.clear();
    for (const auto& [key, value] : json.items()) {
        if (key != "level") explicitKeys_.insert(key);
        if (key != "speech_dir" && key != "noise_dir" && key != "output_dir" &&
            key != "snr_db" && key != "seed" && key != "workers" &&
            key != "use_active_speech" && key != "level" && key != "db_path") {
            extra_[key] = value;
        }
    }
}

JsonValue JobDefinition::toJson() const {
    JsonValue j;
    j["speech_dir"] = speechDir_;
    j["noise_dir"] = noiseDir_;
    j["output_dir"] = outputDir_;
    j["snr_db"] = snrs_;
    j["seed"] = seed_;
    if (workers_) j["workers"] = *workers_;
    j["use_active_speech"] = useActiveSpeech_;
    j["level"] = {
        {"time_constant", level_.timeConstant},
        {"hangover", level_.hangover},
        {"margin_db", level_.marginDb},
        {"ratio", level_.ratio},
        {"levels", level_.levels}
    };
    if (dbPath_) j["db_path"] = *dbPath_;
    for (const auto& [key, value] : extra_) {
        j[key] = value;
    }
    return j;
}

bool JobDefinition::isValid(std::string* why) const {
    auto fail = [why](const char* msg) {
        if (why) *why = msg;
        return false;
    };
    if (speechDir_.empty() || noiseDir_.empty() || outputDir_.empty()) {
        return fail("speech_dir, noise_dir and output_dir are required");
    }
    if (snrs_.empty()) return fail("snr_db must list at least one value");
    for (double s : snrs_) {
        if (!std::isfinite(s)) return fail("snr_db values must be finite");
    }
    if (workers_ && *workers_ < 1) return fail("workers must be at least 1");
    if (!(level_.timeConstant > 0.0) || !(level_.hangover >= 0.0) ||
        !std::isfinite(level_.hangover) || !(level_.ratio > 1.0) || level_.levels < 1 ||
        !std::isfinite(level_.marginDb)) {
        return fail("level settings out of range");
    }
    return true;
}

} // namespace aslmix
