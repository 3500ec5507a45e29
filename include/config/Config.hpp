#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace dd::config {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/debdiff/config.yaml";
inline constexpr const char* DEFAULT_REPO_PATH = "/usr/share/debdiff";

struct DiffConfig {
    std::filesystem::path root = "/";
    std::filesystem::path repo = DEFAULT_REPO_PATH;   // overlay reference tree
    std::filesystem::path ignore_dir;                 // empty disables ignore rules
    bool silent = false;
    bool report_divergent = false;
    bool include_alternatives = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum debdiff      = spdlog::level::info;   // Startup, totals, fatal errors
    spdlog::level::level_enum ignore       = spdlog::level::warn;
    spdlog::level::level_enum inventory    = spdlog::level::warn;   // Skipped entries during walks
    spdlog::level::level_enum diff         = spdlog::level::warn;
    spdlog::level::level_enum crypto       = spdlog::level::warn;
    spdlog::level::level_enum alternatives = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty means console only
    LogLevelsConfig levels;
};

struct Config {
    DiffConfig diff;
    LoggingConfig logging;
};

// Throws YAML::Exception on unreadable or malformed files.
Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const DiffConfig& c);
void from_json(const nlohmann::json& j, DiffConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);

} // namespace dd::config
