#include "audio/wav_file.hpp"
#include "batch/batch_runner.hpp"
#include "batch/job_definition.hpp"
#include "level/active_level.hpp"
#include "level/counter_estimator.hpp"
#include "level/level_error.hpp"
#include "mix/snr_mixer.hpp"
#include "config.hpp"
#include "sqlite_logger.hpp"
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

struct Args {
    std::string command;
    std::vector<std::string> inputs;   // level: files to measure

    std::string config_path;
    std::optional<std::string> job_path;
    std::optional<std::string> speech, noise, out;
    std::optional<std::string> speech_dir, noise_dir, output_dir;
    std::vector<double> snrs;
    bool json = false;
    bool counter = false;              // level: bit-depth counter variant
    std::optional<int> bits;
    bool no_ledger = false;

    AppConfig overrides;               // CLI values win over the config file
};

static void print_usage() {
    std::cout << "aslmix - ITU-T P.56 active speech level and SNR mixing\n"
              << "Usage:\n"
              << "  aslmix level <file.wav>... [--json] [--counter [--bits <n>]]\n"
              << "  aslmix mix --speech <wav> --noise <wav> --snr <dB> --out <wav>\n"
              << "  aslmix batch --job <job.json> | --speech-dir <d> --noise-dir <d> --out-dir <d> [--snr <dB>]...\n"
              << "Options:\n"
              << "      --config <path>          Config file (default XDG)\n"
              << "      --time-constant <s>      Envelope time constant (default 0.03)\n"
              << "      --hangover <s>           Hangover time (default 0.2)\n"
              << "      --margin <dB>            Margin M (default 15.9)\n"
              << "      --ratio <b>              Threshold ladder ratio (default 2.0)\n"
              << "      --levels <n>             Number of thresholds (default 30)\n"
              << "      --seed <n>               Seed for noise window selection (default 0)\n"
              << "  -j, --workers <n>            Batch worker threads (default: all cores)\n"
              << "      --no-active              Mix against mean speech power\n"
              << "      --db <path>              SQLite ledger path (default XDG)\n"
              << "      --no-ledger              Do not write the batch ledger\n"
              << "      --json                   JSON output for 'level'\n"
              << "      --counter                'level' with the fixed-ladder counter estimator\n"
              << "      --bits <n>               Ladder bit depth for --counter (default: file's)\n";
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    a.config_path = default_config_path();
    if (argc < 2) {
        print_usage();
        std::exit(1);
    }
    a.command = argv[1];
    if (a.command == "--help" || a.command == "-h") {
        print_usage();
        std::exit(0);
    }

    for (int i = 2; i < argc; ++i) {
        std::string s = argv[i];
        const bool has_val = i + 1 < argc;
        if      (s == "--config" && has_val) a.config_path = expand_path(argv[++i]);
        else if (s == "--job" && has_val) a.job_path = argv[++i];
        else if (s == "--speech" && has_val) a.speech = argv[++i];
        else if (s == "--noise" && has_val) a.noise = argv[++i];
        else if (s == "--out" && has_val) a.out = argv[++i];
        else if (s == "--speech-dir" && has_val) a.speech_dir = argv[++i];
        else if (s == "--noise-dir" && has_val) a.noise_dir = argv[++i];
        else if (s == "--out-dir" && has_val) a.output_dir = argv[++i];
        else if (s == "--snr" && has_val) a.snrs.push_back(std::stod(argv[++i]));

        else if (s == "--time-constant" && has_val) a.overrides.time_constant = std::stod(argv[++i]);
        else if (s == "--hangover" && has_val) a.overrides.hangover = std::stod(argv[++i]);
        else if (s == "--margin" && has_val) a.overrides.margin_db = std::stod(argv[++i]);
        else if (s == "--ratio" && has_val) a.overrides.ratio = std::stod(argv[++i]);
        else if (s == "--levels" && has_val) a.overrides.levels = std::stoi(argv[++i]);
        else if (s == "--seed" && has_val) a.overrides.seed = std::stoull(argv[++i]);
        else if ((s == "--workers" || s == "-j") && has_val) a.overrides.workers = std::stoi(argv[++i]);
        else if (s == "--no-active") a.overrides.use_active_speech = false;
        else if (s == "--db" && has_val) a.overrides.db_path = expand_path(argv[++i]);
        else if (s == "--no-ledger") a.no_ledger = true;
        else if (s == "--json") a.json = true;
        else if (s == "--counter") a.counter = true;
        else if (s == "--bits" && has_val) a.bits = std::stoi(argv[++i]);

        else if (s == "--help" || s == "-h") {
            print_usage();
            std::exit(0);
        }
        else if (!s.empty() && s[0] == '-') {
            std::cerr << "Unknown option: " << s << "\n";
            std::exit(1);
        }
        else a.inputs.push_back(s);
    }
    return a;
}

// CLI overrides first, then the config file.
static AppConfig merge(const AppConfig& cli, const AppConfig& file) {
    AppConfig m = file;
    if (cli.time_constant) m.time_constant = cli.time_constant;
    if (cli.hangover) m.hangover = cli.hangover;
    if (cli.margin_db) m.margin_db = cli.margin_db;
    if (cli.ratio) m.ratio = cli.ratio;
    if (cli.levels) m.levels = cli.levels;
    if (cli.seed) m.seed = cli.seed;
    if (cli.workers) m.workers = cli.workers;
    if (cli.use_active_speech) m.use_active_speech = cli.use_active_speech;
    if (cli.db_path) m.db_path = cli.db_path;
    return m;
}

static aslmix::ActiveLevelEstimator::Config level_config(const AppConfig& cfg) {
    aslmix::ActiveLevelEstimator::Config base;
    base.timeConstant = cfg.time_constant.value_or(base.timeConstant);
    base.hangover = cfg.hangover.value_or(base.hangover);
    base.marginDb = cfg.margin_db.value_or(base.marginDb);
    base.ratio = cfg.ratio.value_or(base.ratio);
    base.levels = cfg.levels.value_or(base.levels);
    return base;
}

static int run_level(const Args& args, const AppConfig& cfg) {
    if (args.inputs.empty()) {
        std::cerr << "Error: 'level' needs at least one WAV file\n";
        return 1;
    }
    const auto base = level_config(cfg);
    const aslmix::ActiveLevelEstimator estimator(base);
    nlohmann::json out = nlohmann::json::array();
    int failures = 0;

    for (const auto& path : args.inputs) {
        try {
            const aslmix::WavAudio wav = aslmix::readWavMono(path);
            aslmix::LevelResult r;
            if (args.counter) {
                aslmix::CounterLevelEstimator::Config cc;
                // Float files have no native depth; 16 bits matches the common case.
                cc.bitDepth = args.bits.value_or(wav.isFloat ? 16 : wav.bitsPerSample);
                cc.timeConstant = base.timeConstant;
                cc.hangover = base.hangover;
                cc.marginDb = base.marginDb;
                r = aslmix::CounterLevelEstimator(cc).estimate(wav.samples, wav.sampleRate);
            } else {
                r = estimator.estimate(wav.samples, wav.sampleRate);
            }
            if (args.json) {
                out.push_back({
                    {"file", path},
                    {"sample_rate", wav.sampleRate},
                    {"status", aslmix::toString(r.status)},
                    {"active_level_db", r.hasActiveLevel() ? nlohmann::json(r.activeLevelDb) : nlohmann::json()},
                    {"activity", r.activityFraction},
                    {"active_threshold", r.activeThreshold},
                    {"mean_square", r.diagnostics.meanSquare}
                });
            } else {
                std::cout << path << ": ";
                if (r.hasActiveLevel()) {
                    std::cout << std::fixed << std::setprecision(2)
                              << r.activeLevelDb << " dBFS active, "
                              << r.activityFraction * 100.0 << " % activity, threshold "
                              << std::setprecision(6) << r.activeThreshold << "\n";
                } else {
                    std::cout << "no active speech (" << aslmix::toString(r.status) << ")\n";
                }
                std::cout.unsetf(std::ios::floatfield);
            }
        } catch (const aslmix::LevelError& e) {
            std::cerr << path << ": " << aslmix::toString(e.code()) << ": " << e.what() << "\n";
            ++failures;
        } catch (const std::exception& e) {
            std::cerr << path << ": " << e.what() << "\n";
            ++failures;
        }
    }
    if (args.json) std::cout << out.dump(2) << "\n";
    return failures == 0 ? 0 : 2;
}

static int run_mix(const Args& args, const AppConfig& cfg) {
    if (!args.speech || !args.noise || !args.out || args.snrs.size() != 1) {
        std::cerr << "Error: 'mix' needs --speech, --noise, --out and one --snr\n";
        return 1;
    }
    const aslmix::WavAudio speech = aslmix::readWavMono(*args.speech);
    const aslmix::WavAudio noise = aslmix::readWavMono(*args.noise);
    if (speech.sampleRate != noise.sampleRate) {
        std::cerr << "Error: sample rates differ (" << speech.sampleRate << " Hz vs "
                  << noise.sampleRate << " Hz)\n";
        return 1;
    }

    const aslmix::LevelResult level =
        aslmix::ActiveLevelEstimator(level_config(cfg)).estimate(speech.samples, speech.sampleRate);
    if (!level.hasActiveLevel()) {
        std::cerr << "Warning: " << aslmix::toString(level.status)
                  << ", falling back to mean speech power\n";
    }

    std::mt19937_64 rng(cfg.seed.value_or(0));
    const aslmix::SnrMixer mixer({args.snrs.front(), cfg.use_active_speech.value_or(true)});
    const aslmix::MixResult r = mixer.mix(speech.samples, noise.samples, speech.sampleRate, rng, &level);
    aslmix::writeWavPcm16(*args.out, r.mixed, speech.sampleRate);

    std::cout << "Wrote " << *args.out << " (noise gain " << r.appliedGain
              << (r.usedActiveLevel ? ", active speech power" : ", mean speech power") << ")\n";
    if (r.clipped) {
        std::cout << "Note: mix peaked above full scale and was normalized by "
                  << r.normalization << "\n";
    }
    return 0;
}

static int run_batch(const Args& args, const AppConfig& file_cfg) {
    aslmix::JobDefinition job;
    if (args.job_path && !job.loadFromFile(*args.job_path)) {
        return 1;
    }
    if (args.speech_dir) job.setSpeechDir(*args.speech_dir);
    if (args.noise_dir) job.setNoiseDir(*args.noise_dir);
    if (args.output_dir) job.setOutputDir(*args.output_dir);
    if (!args.snrs.empty()) job.setSnrs(args.snrs);
    apply_job_overrides(job, args.overrides, file_cfg);

    std::string why;
    if (!job.isValid(&why)) {
        std::cerr << "Error: " << why << "\n";
        return 1;
    }

    std::optional<RunLogger> ledger;
    std::int64_t run_id = 0;
    if (!args.no_ledger) {
        const std::string db = job.getDbPath().value_or(default_db_path());
        ledger.emplace(db);
        run_id = ledger->start_run(job.toJson().dump());
        std::cout << "Ledger: " << ledger->path() << " (run " << run_id << ")\n";
    }

    aslmix::BatchRunner runner(job);
    runner.setLevelCallback([&](const aslmix::LevelRecord& rec) {
        if (ledger) ledger->log_level(run_id, rec);
    });
    runner.setMixCallback([&](const aslmix::MixRecord& rec) {
        if (ledger) ledger->log_mix(run_id, rec);
    });
    runner.setSkipCallback([&](const aslmix::SkippedPair& rec) {
        std::cerr << "\nSkipped " << rec.speechPath << " + " << rec.noisePath
                  << " @ " << rec.snrDb << " dB: " << rec.reason
                  << (rec.detail.empty() ? "" : " (" + rec.detail + ")") << "\n";
        if (ledger) ledger->log_skip(run_id, rec);
    });
    runner.setProgressCallback([&](std::size_t done, std::size_t total) {
        if (g_stop.load()) runner.requestStop();
        std::cout << "[" << done << "/" << total << "]\r" << std::flush;
    });

    const aslmix::BatchReport report = runner.run();
    if (ledger) ledger->end_run(run_id, report);

    std::cout << "\nPlanned " << report.planned << ", written " << report.written
              << ", skipped " << report.skipped.size() << ", clipped " << report.clipped << "\n";
    if (report.cancelled) {
        std::cout << "Stopped early on request.\n";
        return 130;
    }
    return report.skipped.empty() ? 0 : 2;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    try {
        Args args = parse_args(argc, argv);
        const AppConfig file_cfg = load_config_file(args.config_path);
        const AppConfig cfg = merge(args.overrides, file_cfg);

        if (args.command == "level") return run_level(args, cfg);
        if (args.command == "mix") return run_mix(args, cfg);
        if (args.command == "batch") return run_batch(args, file_cfg);
        std::cerr << "Unknown command: " << args.command << "\n";
        print_usage();
        return 1;
    } catch (const aslmix::LevelError& e) {
        std::cerr << "Error (" << aslmix::toString(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
