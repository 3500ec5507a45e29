#pragma once

#include "config/Config.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dd::cli {

struct ArgsError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
};

struct FlagSpec {
    std::string_view key;
    bool takesValue;
    std::string_view help;
};

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

[[nodiscard]] const std::vector<FlagSpec>& flagSpecs();

// Accepts "-flag", "--flag", "--flag value" and "--flag=value". Throws ArgsError,
// including for a switch given a value that is not a boolean.
CommandCall parseArgs(const std::vector<std::string>& args);
CommandCall parseArgs(int argc, char** argv);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

std::string usage(const std::string& prog);

// --config if given (must exist), else the default path when present, else defaults.
config::Config resolveConfig(const CommandCall& call);

// Command-line values take precedence over the config file.
void applyOverrides(const CommandCall& call, config::Config& cfg);

}
