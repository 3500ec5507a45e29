#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dd::config;

template<>
struct convert<DiffConfig> {
    static Node encode(const DiffConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["repo"] = rhs.repo.string();
        node["ignore_dir"] = rhs.ignore_dir.string();
        node["silent"] = rhs.silent;
        node["report_divergent"] = rhs.report_divergent;
        node["include_alternatives"] = rhs.include_alternatives;
        return node;
    }

    static bool decode(const Node& node, DiffConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/");
        rhs.repo = node["repo"].as<std::string>(DEFAULT_REPO_PATH);
        rhs.ignore_dir = node["ignore_dir"].as<std::string>("");
        rhs.silent = node["silent"].as<bool>(false);
        rhs.report_divergent = node["report_divergent"].as<bool>(false);
        rhs.include_alternatives = node["include_alternatives"].as<bool>(false);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["debdiff"]      = to_std_string(spdlog::level::to_string_view(rhs.debdiff));
        node["ignore"]       = to_std_string(spdlog::level::to_string_view(rhs.ignore));
        node["inventory"]    = to_std_string(spdlog::level::to_string_view(rhs.inventory));
        node["diff"]         = to_std_string(spdlog::level::to_string_view(rhs.diff));
        node["crypto"]       = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["alternatives"] = to_std_string(spdlog::level::to_string_view(rhs.alternatives));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.debdiff = spdlog::level::from_str(node["debdiff"].as<std::string>("info"));
        rhs.ignore = spdlog::level::from_str(node["ignore"].as<std::string>("warn"));
        rhs.inventory = spdlog::level::from_str(node["inventory"].as<std::string>("warn"));
        rhs.diff = spdlog::level::from_str(node["diff"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.alternatives = spdlog::level::from_str(node["alternatives"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
