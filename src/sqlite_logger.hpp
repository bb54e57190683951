#pragma once
#include "batch/batch_runner.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>

// Ledger of batch mixing runs.
// Schema:
//  - runs(id INTEGER PK, started_ms, ended_ms, job_json, written, skipped, clipped)
//  - level_measurements(run_id, speech_path, sample_rate, num_samples,
//                       active_level_db, activity, active_threshold, status)
//  - mix_outputs(run_id, speech_path, noise_path, snr_db, output_path, gain,
//                clipped, used_active_level)
//  - skipped_pairs(run_id, speech_path, noise_path, snr_db, reason, detail)
//
// Notes:
//  * Times are system_clock millis.
//  * Thread-safe: BatchRunner callbacks arrive from worker threads, so every
//    statement runs under one mutex.
//  * -inf levels (degenerate or no crossing) are stored as NULL.
class RunLogger {
public:
    explicit RunLogger(const std::string& db_path);
    ~RunLogger();

    RunLogger(const RunLogger&) = delete;
    RunLogger& operator=(const RunLogger&) = delete;

    // Begins a run; returns the new run id.
    std::int64_t start_run(const std::string& job_json);

    // Marks end time and totals for a run.
    void end_run(std::int64_t run_id, const aslmix::BatchReport& report);

    void log_level(std::int64_t run_id, const aslmix::LevelRecord& rec);
    void log_mix(std::int64_t run_id, const aslmix::MixRecord& rec);
    void log_skip(std::int64_t run_id, const aslmix::SkippedPair& rec);

    // Row count of one of the ledger tables, for summaries.
    std::int64_t count_rows(const std::string& table, std::int64_t run_id);

    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    sqlite3_stmt* prepare(const char* sql);
    void step_and_finalize(sqlite3_stmt* st, const char* what);
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mu_;
};
