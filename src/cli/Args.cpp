#include "cli/Args.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>

namespace dd::cli {

namespace {

const FlagSpec* findSpec(const std::string_view key) {
    const auto& specs = flagSpecs();
    const auto it = std::ranges::find(specs, key, &FlagSpec::key);
    return it == specs.end() ? nullptr : &*it;
}

// "overlay" is the descriptive name for the repo directory
std::string canonicalKey(std::string key) {
    if (key == "overlay") return "repo";
    if (key == "h") return "help";
    return key;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ArgsError(fmt::format("invalid boolean value \"{}\" for -{}", value, key));
}

bool boolFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return v ? parseBool(key, *v) : true;
    return false;
}

}

const std::vector<FlagSpec>& flagSpecs() {
    static const std::vector<FlagSpec> specs = {
        {"silent",       false, "suppress non-fatal diagnostics"},
        {"root",         true,  "installation root (default /)"},
        {"repo",         true,  "overlay (repo) directory (default /usr/share/debdiff)"},
        {"overlay",      true,  "alias for -repo"},
        {"ignore",       true,  "directory of ignore files"},
        {"config",       true,  "config file (default /etc/debdiff/config.yaml)"},
        {"diff",         false, "also report repo files whose content differs on disk"},
        {"json",         false, "print the report as JSON"},
        {"alternatives", false, "count update-alternatives links as packaged"},
        {"print-config", false, "print the effective configuration and exit"},
        {"help",         false, "show this help"},
        {"h",            false, "show this help"},
    };
    return specs;
}

CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    if (args.empty()) return call;

    call.name = args.front();

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--") {
            if (i + 1 < args.size()) throw ArgsError("unexpected argument: " + args[i + 1]);
            break;
        }
        if (arg.size() < 2 || arg.front() != '-') throw ArgsError("unexpected argument: " + arg);

        std::string key = arg.substr(arg.starts_with("--") ? 2 : 1);
        std::optional<std::string> value;
        if (const auto eq = key.find('='); eq != std::string::npos) {
            value = key.substr(eq + 1);
            key.erase(eq);
        }

        const auto* spec = findSpec(key);
        if (!spec) throw ArgsError("unknown flag: " + arg);

        if (spec->takesValue && !value) {
            if (i + 1 >= args.size()) throw ArgsError("flag needs a value: " + arg);
            value = args[++i];
        }
        if (!spec->takesValue && value) (void)parseBool(key, *value);

        setOpt(call, canonicalKey(key), value);
    }

    return call;
}

CommandCall parseArgs(const int argc, char** argv) {
    return parseArgs(std::vector<std::string>(argv, argv + argc));
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return boolFlag(c, key);
}

std::string usage(const std::string& prog) {
    std::string out = fmt::format("usage: {} [flags]\n\n", prog.empty() ? "debdiff" : prog);
    for (const auto& [key, takesValue, help] : flagSpecs()) {
        if (key == "h") continue;
        const auto flag = fmt::format("-{}{}", key, takesValue ? " <value>" : "");
        out += fmt::format("  {:<24}{}\n", flag, help);
    }
    return out;
}

config::Config resolveConfig(const CommandCall& call) {
    if (const auto path = optVal(call, "config")) return config::loadConfig(*path);
    if (std::filesystem::exists(config::DEFAULT_CONFIG_PATH)) return config::loadConfig(config::DEFAULT_CONFIG_PATH);
    return {};
}

void applyOverrides(const CommandCall& call, config::Config& cfg) {
    if (const auto v = optVal(call, "root")) cfg.diff.root = *v;
    if (const auto v = optVal(call, "repo")) cfg.diff.repo = *v;
    if (const auto v = optVal(call, "ignore")) cfg.diff.ignore_dir = *v;
    if (hasFlag(call, "silent")) cfg.diff.silent = true;
    if (hasFlag(call, "diff")) cfg.diff.report_divergent = true;
    if (hasFlag(call, "alternatives")) cfg.diff.include_alternatives = true;
}

}
