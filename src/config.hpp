#pragma once
#include "batch/job_definition.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct AppConfig {
    std::optional<double> time_constant;       // --time-constant
    std::optional<double> hangover;            // --hangover
    std::optional<double> margin_db;           // --margin
    std::optional<double> ratio;               // --ratio
    std::optional<int> levels;                 // --levels

    std::optional<std::uint64_t> seed;         // --seed
    std::optional<int> workers;                // -j / --workers
    std::optional<bool> use_active_speech;     // --no-active

    std::optional<std::string> db_path;        // --db
};

// Returns $XDG_CONFIG_HOME/aslmix/aslmix.toml or ~/.config/aslmix/aslmix.toml
std::string default_config_path();

// Returns $XDG_DATA_HOME/aslmix/aslmix.db or ~/.local/share/aslmix/aslmix.db
std::string default_db_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
// Unparseable values are reported on stderr and left disengaged.
AppConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Layers batch settings onto a loaded job: command line values win, then
// values the job JSON sets, then the config file. A file value is applied only
// for keys the job leaves unset.
void apply_job_overrides(aslmix::JobDefinition& job, const AppConfig& cli, const AppConfig& file);
