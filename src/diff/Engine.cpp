#include "diff/Engine.hpp"
#include "alternatives/Alternatives.hpp"
#include "crypto/util/hash.hpp"
#include "inventory/DiskScanner.hpp"
#include "inventory/OverlayScanner.hpp"
#include "inventory/PackageScanner.hpp"
#include "inventory/Walker.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"

#include <fmt/format.h>
#include <system_error>
#include <utility>

using namespace dd::diff;
using namespace dd::inventory;
using namespace dd::logging;
namespace fs = std::filesystem;

StageError::StageError(std::string stage, const std::string& cause)
    : std::runtime_error(fmt::format("[{}] {}", stage, cause)), stage(std::move(stage)) {}

std::vector<std::string> dd::diff::unpackagedFiles(const Inventory& disk,
                                                   const Inventory& overlay,
                                                   const Inventory& packages) {
    std::vector<std::string> out;
    for (const auto& path : disk) {
        if (overlay.contains(path)) continue;
        if (packages.contains(path)) continue;
        out.push_back(path);
    }
    return out;
}

std::optional<std::string> dd::diff::hashOrEmpty(const fs::path& path) {
    try {
        return crypto::hash::blake2b(path);
    } catch (const std::system_error& e) {
        const auto& ec = e.code();
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) return std::string();
        if (isPermissionError(ec)) {
            LogRegistry::diff()->warn("[Engine] Skipping file: {}", e.what());
            return std::nullopt;
        }
        throw;
    }
}

std::vector<std::string> dd::diff::divergentFiles(const Inventory& overlay,
                                                  const fs::path& root,
                                                  const fs::path& repo) {
    std::vector<std::string> out;
    for (const auto& file : overlay) {
        const auto realHash = hashOrEmpty(util::underBase(root, file));
        if (!realHash) continue;

        const auto repoHash = hashOrEmpty(util::underBase(repo, file));
        if (!repoHash) continue;

        if (*realHash != *repoHash) out.push_back(file);
    }
    return out;
}

Engine::Engine(config::DiffConfig settings) : settings_(std::move(settings)) {}

std::vector<Stage> Engine::stages() const {
    std::vector<Stage> stages = {
        {"walking ignore directory",  &Engine::loadIgnoreRules},
        {"walking all files",         &Engine::buildDisk},
        {"walking repo files",        &Engine::buildOverlay},
        {"reading dpkg info files",   &Engine::buildPackages},
        {"finding unpackaged files",  &Engine::findUnpackaged},
    };
    if (settings_.report_divergent) stages.push_back({"comparing repo files", &Engine::findDivergent});
    return stages;
}

Context Engine::run() const {
    const auto list = stages();
    return runStages(Context(settings_), list);
}

Context Engine::runStages(Context ctx, const std::span<const Stage> stages) {
    for (const auto& [name, fn] : stages) {
        LogRegistry::diff()->debug("[Engine] Stage '{}'", name);
        try {
            ctx = fn(std::move(ctx));
        } catch (const std::exception& e) {
            throw StageError(name, e.what());
        }
    }
    return ctx;
}

Context Engine::loadIgnoreRules(Context ctx) {
    ctx.ignoreRules = ignore::RuleSet::loadFromDirectory(ctx.settings.ignore_dir);
    return ctx;
}

Context Engine::buildDisk(Context ctx) {
    ctx.disk = DiskScanner::build(ctx.settings.root, ctx.ignoreRules);
    return ctx;
}

Context Engine::buildOverlay(Context ctx) {
    ctx.overlay = OverlayScanner::build(ctx.settings.repo);
    return ctx;
}

Context Engine::buildPackages(Context ctx) {
    std::vector<std::string> extra;
    if (ctx.settings.include_alternatives) {
        if (util::trimTrailingSlash(ctx.settings.root.string()) != "/")
            LogRegistry::alternatives()->warn("[Engine] Alternatives are queried from the running system, not {}",
                                              ctx.settings.root.string());
        extra = alternatives::collectManagedPaths();
    }
    ctx.packages = PackageScanner::build(ctx.settings.root, std::move(extra));
    return ctx;
}

Context Engine::findUnpackaged(Context ctx) {
    ctx.unpackaged = unpackagedFiles(ctx.disk, ctx.overlay, ctx.packages);
    LogRegistry::diff()->info("[Engine] {} unpackaged of {} files", ctx.unpackaged.size(), ctx.disk.size());
    return ctx;
}

Context Engine::findDivergent(Context ctx) {
    ctx.divergent = divergentFiles(ctx.overlay, ctx.settings.root, ctx.settings.repo);
    LogRegistry::diff()->info("[Engine] {} of {} repo files diverge", ctx.divergent->size(), ctx.overlay.size());
    return ctx;
}
