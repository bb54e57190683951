#include "config.hpp"
#include "test_signals.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

namespace {

std::string write_config(const aslmix::testing::TempDir& dir, const std::string& text) {
    const std::string path = dir.file("aslmix.toml");
    std::ofstream f(path);
    f << text;
    return path;
}

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = old;
        setenv(name, value.c_str(), 1);
    }
    ~EnvGuard() {
        if (old_) setenv(name_, old_->c_str(), 1);
        else unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ConfigTest, ParsesKeysCommentsAndQuotes) {
    aslmix::testing::TempDir dir;
    const std::string path = write_config(dir,
        "# estimator\n"
        "time_constant = 0.05\n"
        "H: 0.1   ; shorter hangover\n"
        "margin = 12.5\n"
        "ratio=1.5\n"
        "levels = 40\n"
        "\n"
        "seed = 18446744073709551615\n"
        "workers = 6\n"
        "use_active_speech = no\n"
        "db_path = \"/var/lib/aslmix/ledger.db\"\n");

    const AppConfig cfg = load_config_file(path);
    ASSERT_TRUE(cfg.time_constant);
    EXPECT_DOUBLE_EQ(*cfg.time_constant, 0.05);
    ASSERT_TRUE(cfg.hangover);
    EXPECT_DOUBLE_EQ(*cfg.hangover, 0.1);
    ASSERT_TRUE(cfg.margin_db);
    EXPECT_DOUBLE_EQ(*cfg.margin_db, 12.5);
    ASSERT_TRUE(cfg.ratio);
    EXPECT_DOUBLE_EQ(*cfg.ratio, 1.5);
    EXPECT_EQ(cfg.levels, 40);
    EXPECT_EQ(cfg.seed, 18446744073709551615ull);
    EXPECT_EQ(cfg.workers, 6);
    EXPECT_EQ(cfg.use_active_speech, false);
    EXPECT_EQ(cfg.db_path, "/var/lib/aslmix/ledger.db");
}

TEST(ConfigTest, MissingFileIsEmpty) {
    aslmix::testing::TempDir dir;
    const AppConfig cfg = load_config_file(dir.file("absent.toml"));
    EXPECT_FALSE(cfg.time_constant);
    EXPECT_FALSE(cfg.levels);
    EXPECT_FALSE(cfg.seed);
    EXPECT_FALSE(cfg.db_path);
}

TEST(ConfigTest, BadValuesStayUnset) {
    aslmix::testing::TempDir dir;
    const std::string path = write_config(dir,
        "levels = many\n"
        "hangover = soon\n"
        "use_active_speech = maybe\n"
        "colour = blue\n"
        "ratio = 3\n");

    const AppConfig cfg = load_config_file(path);
    EXPECT_FALSE(cfg.levels);
    EXPECT_FALSE(cfg.hangover);
    EXPECT_FALSE(cfg.use_active_speech);
    ASSERT_TRUE(cfg.ratio);
    EXPECT_DOUBLE_EQ(*cfg.ratio, 3.0);
}

TEST(ConfigTest, ExpandsHomeAndXdgPaths) {
    EnvGuard home("HOME", "/home/tester");
    EXPECT_EQ(expand_path("~/corpus/out"), "/home/tester/corpus/out");
    EXPECT_EQ(expand_path("/abs/path"), "/abs/path");
    EXPECT_EQ(expand_path("~user/x"), "~user/x");

    {
        EnvGuard data("XDG_DATA_HOME", "/xdg/data");
        EXPECT_EQ(default_db_path(), "/xdg/data/aslmix/aslmix.db");
    }
    {
        EnvGuard data("XDG_DATA_HOME", "");
        EXPECT_EQ(default_db_path(), "/home/tester/.local/share/aslmix/aslmix.db");
    }
    {
        EnvGuard cfg("XDG_CONFIG_HOME", "/xdg/config");
        EXPECT_EQ(default_config_path(), "/xdg/config/aslmix/aslmix.toml");
    }

    aslmix::testing::TempDir dir;
    const AppConfig cfg = load_config_file(write_config(dir, "db_path = ~/ledger.db\n"));
    EXPECT_EQ(cfg.db_path, "/home/tester/ledger.db");
}

TEST(ConfigTest, JobValuesBeatConfigFileButNotCommandLine) {
    aslmix::JobDefinition job;
    ASSERT_TRUE(job.loadFromJson({
        {"speech_dir", "s"}, {"noise_dir", "n"}, {"output_dir", "o"},
        {"seed", 1234}, {"workers", 3},
        {"level", {{"margin_db", 12.0}}}
    }));

    AppConfig file;
    file.seed = 0;
    file.workers = 8;
    file.use_active_speech = false;
    file.margin_db = 20.0;
    file.hangover = 0.1;
    file.db_path = "/from/file.db";

    apply_job_overrides(job, AppConfig{}, file);
    EXPECT_EQ(job.getSeed(), 1234u);
    EXPECT_EQ(job.getWorkers(), 3);
    EXPECT_DOUBLE_EQ(job.getLevelConfig().marginDb, 12.0);
    // Keys the job leaves unset come from the file.
    EXPECT_FALSE(job.useActiveSpeech());
    EXPECT_DOUBLE_EQ(job.getLevelConfig().hangover, 0.1);
    EXPECT_EQ(job.getDbPath(), "/from/file.db");

    AppConfig cli;
    cli.seed = 7;
    cli.margin_db = 14.0;
    apply_job_overrides(job, cli, file);
    EXPECT_EQ(job.getSeed(), 7u);
    EXPECT_DOUBLE_EQ(job.getLevelConfig().marginDb, 14.0);
    EXPECT_EQ(job.getWorkers(), 3);
}

TEST(ConfigTest, FileValuesFillJobWithoutJson) {
    aslmix::JobDefinition job;
    job.setSpeechDir("s");
    job.setNoiseDir("n");
    job.setOutputDir("o");

    AppConfig file;
    file.seed = 99;
    file.levels = 20;
    apply_job_overrides(job, AppConfig{}, file);
    EXPECT_EQ(job.getSeed(), 99u);
    EXPECT_EQ(job.getLevelConfig().levels, 20);
    EXPECT_DOUBLE_EQ(job.getLevelConfig().marginDb, 15.9);
    EXPECT_FALSE(job.getWorkers().has_value());
}
