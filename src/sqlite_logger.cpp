#include "sqlite_logger.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <stdexcept>

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

static void bind_level(sqlite3_stmt* st, int idx, double v) {
    if (std::isfinite(v)) sqlite3_bind_double(st, idx, v);
    else sqlite3_bind_null(st, idx);
}

RunLogger::RunLogger(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path + ": " + msg);
    }
    init_schema();
}

RunLogger::~RunLogger() {
    if (db_) sqlite3_close(db_);
}

void RunLogger::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS runs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        job_json TEXT,
        written INTEGER DEFAULT 0,
        skipped INTEGER DEFAULT 0,
        clipped INTEGER DEFAULT 0
    );
    CREATE TABLE IF NOT EXISTS level_measurements (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_id INTEGER NOT NULL,
        speech_path TEXT NOT NULL,
        sample_rate INTEGER NOT NULL,
        num_samples INTEGER NOT NULL,
        active_level_db REAL,
        activity REAL NOT NULL,
        active_threshold REAL NOT NULL,
        status TEXT NOT NULL,
        FOREIGN KEY(run_id) REFERENCES runs(id)
    );
    CREATE TABLE IF NOT EXISTS mix_outputs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_id INTEGER NOT NULL,
        speech_path TEXT NOT NULL,
        noise_path TEXT NOT NULL,
        snr_db REAL NOT NULL,
        output_path TEXT NOT NULL,
        gain REAL NOT NULL,
        clipped INTEGER NOT NULL,
        used_active_level INTEGER NOT NULL,
        FOREIGN KEY(run_id) REFERENCES runs(id)
    );
    CREATE TABLE IF NOT EXISTS skipped_pairs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_id INTEGER NOT NULL,
        speech_path TEXT NOT NULL,
        noise_path TEXT NOT NULL,
        snr_db REAL NOT NULL,
        reason TEXT NOT NULL,
        detail TEXT,
        FOREIGN KEY(run_id) REFERENCES runs(id)
    );
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t RunLogger::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

sqlite3_stmt* RunLogger::prepare(const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_));
    }
    return st;
}

void RunLogger::step_and_finalize(sqlite3_stmt* st, const char* what) {
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to ") + what + ": " + sqlite3_errmsg(db_));
    }
}

std::int64_t RunLogger::start_run(const std::string& job_json) {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* st = prepare("INSERT INTO runs (started_ms, job_json) VALUES (?, ?);");
    sqlite3_bind_int64(st, 1, now_ms());
    sqlite3_bind_text(st, 2, job_json.c_str(), -1, SQLITE_TRANSIENT);
    step_and_finalize(st, "insert run");
    return sqlite3_last_insert_rowid(db_);
}

void RunLogger::end_run(std::int64_t run_id, const aslmix::BatchReport& report) {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* st = prepare(
        "UPDATE runs SET ended_ms=?, written=?, skipped=?, clipped=? WHERE id=?;");
    sqlite3_bind_int64(st, 1, now_ms());
    sqlite3_bind_int64(st, 2, static_cast<std::int64_t>(report.written));
    sqlite3_bind_int64(st, 3, static_cast<std::int64_t>(report.skipped.size()));
    sqlite3_bind_int64(st, 4, static_cast<std::int64_t>(report.clipped));
    sqlite3_bind_int64(st, 5, run_id);
    step_and_finalize(st, "update run");
}

void RunLogger::log_level(std::int64_t run_id, const aslmix::LevelRecord& rec) {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* st = prepare(
        "INSERT INTO level_measurements (run_id, speech_path, sample_rate, num_samples, "
        "active_level_db, activity, active_threshold, status) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(st, 1, run_id);
    sqlite3_bind_text(st, 2, rec.speechPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st, 3, rec.sampleRate);
    sqlite3_bind_int64(st, 4, static_cast<std::int64_t>(rec.numSamples));
    bind_level(st, 5, rec.activeLevelDb);
    sqlite3_bind_double(st, 6, rec.activityFraction);
    sqlite3_bind_double(st, 7, rec.activeThreshold);
    sqlite3_bind_text(st, 8, aslmix::toString(rec.status), -1, SQLITE_STATIC);
    step_and_finalize(st, "insert level measurement");
}

void RunLogger::log_mix(std::int64_t run_id, const aslmix::MixRecord& rec) {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* st = prepare(
        "INSERT INTO mix_outputs (run_id, speech_path, noise_path, snr_db, output_path, gain, "
        "clipped, used_active_level) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(st, 1, run_id);
    sqlite3_bind_text(st, 2, rec.speechPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, rec.noisePath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st, 4, rec.snrDb);
    sqlite3_bind_text(st, 5, rec.outputPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st, 6, rec.gain);
    sqlite3_bind_int(st, 7, rec.clipped ? 1 : 0);
    sqlite3_bind_int(st, 8, rec.usedActiveLevel ? 1 : 0);
    step_and_finalize(st, "insert mix output");
}

void RunLogger::log_skip(std::int64_t run_id, const aslmix::SkippedPair& rec) {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* st = prepare(
        "INSERT INTO skipped_pairs (run_id, speech_path, noise_path, snr_db, reason, detail) "
        "VALUES (?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int64(st, 1, run_id);
    sqlite3_bind_text(st, 2, rec.speechPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, rec.noisePath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st, 4, rec.snrDb);
    sqlite3_bind_text(st, 5, rec.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 6, rec.detail.c_str(), -1, SQLITE_TRANSIENT);
    step_and_finalize(st, "insert skipped pair");
}

std::int64_t RunLogger::count_rows(const std::string& table, std::int64_t run_id) {
    if (table != "level_measurements" && table != "mix_outputs" && table != "skipped_pairs") {
        throw std::invalid_argument("Unknown ledger table: " + table);
    }
    std::lock_guard<std::mutex> lock(mu_);
    const std::string sql = "SELECT COUNT(*) FROM " + table + " WHERE run_id=?;";
    sqlite3_stmt* st = prepare(sql.c_str());
    sqlite3_bind_int64(st, 1, run_id);
    std::int64_t n = 0;
    if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    return n;
}
