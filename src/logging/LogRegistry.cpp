#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace dd::logging {

void LogRegistry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cfg = config::ConfigRegistry::get();
    const auto& cnf = cfg.logging;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks = { console_sink_ };

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        log_dir_ = cnf.log_dir;
        main_log_path_ = log_dir_ / "debdiff.log";
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("debdiff",      sub_levels.debdiff);
    makeLogger("ignore",       sub_levels.ignore);
    makeLogger("inventory",    sub_levels.inventory);
    makeLogger("diff",         sub_levels.diff);
    makeLogger("crypto",       sub_levels.crypto);
    makeLogger("alternatives", sub_levels.alternatives);

    initialized_ = true;

    if (cfg.diff.silent) setSilent(true);
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::setSilent(const bool silent) {
    if (!initialized_) return;

    const auto& levels = config::ConfigRegistry::get().logging.levels.subsystem_levels;
    const std::pair<const char*, spdlog::level::level_enum> configured[] = {
        {"debdiff", levels.debdiff},
        {"ignore", levels.ignore},
        {"inventory", levels.inventory},
        {"diff", levels.diff},
        {"crypto", levels.crypto},
        {"alternatives", levels.alternatives},
    };

    for (const auto& [name, lvl] : configured)
        get(name)->set_level(silent ? spdlog::level::err : lvl);
}

}
