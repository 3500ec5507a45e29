#pragma once

#include "diff/Context.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace dd::diff {

// A failed stage, message formatted as "[<stage>] <cause>".
struct StageError : std::runtime_error {
    std::string stage;
    StageError(std::string stage, const std::string& cause);
};

struct Stage {
    const char* name;
    std::function<Context(Context)> fn;
};

// Paths on disk that neither the overlay nor any package accounts for, in disk order.
std::vector<std::string> unpackagedFiles(const inventory::Inventory& disk,
                                         const inventory::Inventory& overlay,
                                         const inventory::Inventory& packages);

// Overlay paths whose content under root differs from the copy under repo.
std::vector<std::string> divergentFiles(const inventory::Inventory& overlay,
                                        const std::filesystem::path& root,
                                        const std::filesystem::path& repo);

// Content hash for the divergence pass: "" when the file is missing,
// nullopt when permission is denied. Other errors throw.
std::optional<std::string> hashOrEmpty(const std::filesystem::path& path);

class Engine {
public:
    explicit Engine(config::DiffConfig settings);

    // Runs every stage in order. Throws StageError on the first failure.
    Context run() const;

    [[nodiscard]] std::vector<Stage> stages() const;

    static Context loadIgnoreRules(Context ctx);
    static Context buildDisk(Context ctx);
    static Context buildOverlay(Context ctx);
    static Context buildPackages(Context ctx);
    static Context findUnpackaged(Context ctx);
    static Context findDivergent(Context ctx);

    static Context runStages(Context ctx, std::span<const Stage> stages);

private:
    config::DiffConfig settings_;
};

}
