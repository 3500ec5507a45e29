#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace dd::logging {

class LogRegistry {
public:
    // Builds every subsystem logger from ConfigRegistry::get().
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> debdiff()      { return get("debdiff"); }
    static std::shared_ptr<spdlog::logger> ignore()       { return get("ignore"); }
    static std::shared_ptr<spdlog::logger> inventory()    { return get("inventory"); }
    static std::shared_ptr<spdlog::logger> diff()         { return get("diff"); }
    static std::shared_ptr<spdlog::logger> crypto()       { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> alternatives() { return get("alternatives"); }

    [[nodiscard]] static bool isInitialized();

    // Raises every logger to err so only fatal problems reach the operator.
    static void setSilent(bool silent);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // stdout carries the report, so the console sink is stderr
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
