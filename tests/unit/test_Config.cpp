#include "TempTree.hpp"
#include "cli/Args.hpp"
#include "config/Config.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace dd::config;
using dd::test::TempTreeTest;

class ConfigTest : public TempTreeTest {};

TEST_F(ConfigTest, DefaultsMatchTheStockInstall) {
    const Config cfg;
    EXPECT_EQ(cfg.diff.root.string(), "/");
    EXPECT_EQ(cfg.diff.repo.string(), "/usr/share/debdiff");
    EXPECT_TRUE(cfg.diff.ignore_dir.empty());
    EXPECT_FALSE(cfg.diff.silent);
    EXPECT_FALSE(cfg.diff.report_divergent);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST_F(ConfigTest, LoadsDiffAndLoggingSections) {
    const auto file = writeFile(base, "config.yaml",
        "diff:\n"
        "  root: /mnt/target\n"
        "  repo: /srv/overlay\n"
        "  ignore_dir: /etc/debdiff/ignore.d\n"
        "  silent: true\n"
        "  report_divergent: true\n"
        "logging:\n"
        "  log_dir: /var/log/debdiff\n"
        "  log_levels:\n"
        "    console_log_level: debug\n"
        "    subsystem_levels:\n"
        "      inventory: trace\n");

    const auto cfg = loadConfig(file.string());
    EXPECT_EQ(cfg.diff.root.string(), "/mnt/target");
    EXPECT_EQ(cfg.diff.repo.string(), "/srv/overlay");
    EXPECT_EQ(cfg.diff.ignore_dir.string(), "/etc/debdiff/ignore.d");
    EXPECT_TRUE(cfg.diff.silent);
    EXPECT_TRUE(cfg.diff.report_divergent);
    EXPECT_FALSE(cfg.diff.include_alternatives);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/var/log/debdiff");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.inventory, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.diff, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const auto file = writeFile(base, "config.yaml", "diff:\n  ignore_dir: /etc/ignore\n");
    const auto cfg = loadConfig(file.string());
    EXPECT_EQ(cfg.diff.root.string(), "/");
    EXPECT_EQ(cfg.diff.repo.string(), DEFAULT_REPO_PATH);
    EXPECT_EQ(cfg.diff.ignore_dir.string(), "/etc/ignore");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadConfig((base / "nope.yaml").string()), YAML::BadFile);
}

TEST_F(ConfigTest, JsonCarriesEveryField) {
    Config cfg;
    cfg.diff.root = "/mnt";
    cfg.diff.include_alternatives = true;
    cfg.logging.levels.subsystem_levels.crypto = spdlog::level::err;

    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("diff").at("root"), "/mnt");
    EXPECT_EQ(j.at("diff").at("include_alternatives"), true);
    EXPECT_EQ(j.at("logging").at("log_levels").at("subsystem_levels").at("crypto"), "error");

    const auto back = j.get<Config>();
    EXPECT_EQ(back.diff.root.string(), "/mnt");
    EXPECT_TRUE(back.diff.include_alternatives);
    EXPECT_EQ(back.logging.levels.subsystem_levels.crypto, spdlog::level::err);
}

TEST_F(ConfigTest, ExplicitConfigFlagMustExist) {
    const auto call = dd::cli::parseArgs({"debdiff", "--config", (base / "absent.yaml").string()});
    EXPECT_THROW((void)dd::cli::resolveConfig(call), YAML::BadFile);
}

TEST_F(ConfigTest, ExplicitConfigFlagIsLoaded) {
    const auto file = writeFile(base, "custom.yaml", "diff:\n  repo: /srv/custom\n");
    const auto call = dd::cli::parseArgs({"debdiff", "-config", file.string()});
    EXPECT_EQ(dd::cli::resolveConfig(call).diff.repo.string(), "/srv/custom");
}
