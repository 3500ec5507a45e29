#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace dd::config {

namespace {

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

spdlog::level::level_enum levelOr(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

}

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["diff"]) YAML::convert<DiffConfig>::decode(node, cfg.diff);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"diff", c.diff},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("diff")) j.at("diff").get_to(c.diff);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const DiffConfig& c) {
    j = {
        {"root", c.root.string()},
        {"repo", c.repo.string()},
        {"ignore_dir", c.ignore_dir.string()},
        {"silent", c.silent},
        {"report_divergent", c.report_divergent},
        {"include_alternatives", c.include_alternatives}
    };
}

void from_json(const nlohmann::json& j, DiffConfig& c) {
    c.root = j.value("root", std::string("/"));
    c.repo = j.value("repo", std::string(DEFAULT_REPO_PATH));
    c.ignore_dir = j.value("ignore_dir", std::string());
    c.silent = j.value("silent", false);
    c.report_divergent = j.value("report_divergent", false);
    c.include_alternatives = j.value("include_alternatives", false);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string());
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelOr(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelOr(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"debdiff", levelName(c.debdiff)},
        {"ignore", levelName(c.ignore)},
        {"inventory", levelName(c.inventory)},
        {"diff", levelName(c.diff)},
        {"crypto", levelName(c.crypto)},
        {"alternatives", levelName(c.alternatives)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.debdiff = levelOr(j, "debdiff", spdlog::level::info);
    c.ignore = levelOr(j, "ignore", spdlog::level::warn);
    c.inventory = levelOr(j, "inventory", spdlog::level::warn);
    c.diff = levelOr(j, "diff", spdlog::level::warn);
    c.crypto = levelOr(j, "crypto", spdlog::level::warn);
    c.alternatives = levelOr(j, "alternatives", spdlog::level::warn);
}

} // namespace dd::config
