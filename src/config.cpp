#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/aslmix/aslmix.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/aslmix/aslmix.toml";
}

std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return string(xdg) + "/aslmix/aslmix.db";
    const char* home = std::getenv("HOME");
    return string(home ? home : ".") + "/.local/share/aslmix/aslmix.db";
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;
        val = unquote(val);

        auto warn = [&](const char* kind) {
            std::cerr << "Warning: " << path << ":" << lineno << ": expected " << kind
                      << " for '" << key << "', got '" << val << "'\n";
        };
        auto as_int = [&](const string& s)->std::optional<int>{
            try { return std::stoi(s); } catch (const std::exception&) { warn("integer"); return std::nullopt; }
        };
        auto as_u64 = [&](const string& s)->std::optional<std::uint64_t>{
            try { return static_cast<std::uint64_t>(std::stoull(s)); } catch (const std::exception&) { warn("unsigned integer"); return std::nullopt; }
        };
        auto as_double = [&](const string& s)->std::optional<double>{
            try { return std::stod(s); } catch (const std::exception&) { warn("number"); return std::nullopt; }
        };
        auto as_bool = [&](const string& s)->std::optional<bool>{
            if (ieq(s, "true") || ieq(s,"yes") || s=="1") return true;
            if (ieq(s, "false")|| ieq(s,"no")  || s=="0") return false;
            warn("boolean");
            return std::nullopt;
        };

        if (ieq(key, "time_constant") || ieq(key, "T")) cfg.time_constant = as_double(val);
        else if (ieq(key, "hangover") || ieq(key, "H")) cfg.hangover = as_double(val);
        else if (ieq(key, "margin_db") || ieq(key, "margin")) cfg.margin_db = as_double(val);
        else if (ieq(key, "ratio")) cfg.ratio = as_double(val);
        else if (ieq(key, "levels")) cfg.levels = as_int(val);
        else if (ieq(key, "seed")) cfg.seed = as_u64(val);
        else if (ieq(key, "workers")) cfg.workers = as_int(val);
        else if (ieq(key, "use_active_speech")) cfg.use_active_speech = as_bool(val);
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
        else std::cerr << "Warning: " << path << ":" << lineno << ": unknown key '" << key << "'\n";
    }
    return cfg;
}

template <typename T>
static std::optional<T> layered(const std::optional<T>& cli, const std::optional<T>& file,
                                bool set_by_job) {
    if (cli) return cli;
    if (set_by_job) return std::nullopt;
    return file;
}

void apply_job_overrides(aslmix::JobDefinition& job, const AppConfig& cli, const AppConfig& file) {
    auto level = job.getLevelConfig();
    if (auto v = layered(cli.time_constant, file.time_constant, job.isExplicit("level.time_constant")))
        level.timeConstant = *v;
    if (auto v = layered(cli.hangover, file.hangover, job.isExplicit("level.hangover")))
        level.hangover = *v;
    if (auto v = layered(cli.margin_db, file.margin_db, job.isExplicit("level.margin_db")))
        level.marginDb = *v;
    if (auto v = layered(cli.ratio, file.ratio, job.isExplicit("level.ratio")))
        level.ratio = *v;
    if (auto v = layered(cli.levels, file.levels, job.isExplicit("level.levels")))
        level.levels = *v;
    job.setLevelConfig(level);

    if (auto v = layered(cli.seed, file.seed, job.isExplicit("seed"))) job.setSeed(*v);
    if (auto v = layered(cli.workers, file.workers, job.isExplicit("workers"))) job.setWorkers(*v);
    if (auto v = layered(cli.use_active_speech, file.use_active_speech, job.isExplicit("use_active_speech")))
        job.setUseActiveSpeech(*v);
    if (auto v = layered(cli.db_path, file.db_path, job.isExplicit("db_path"))) job.setDbPath(*v);
}
