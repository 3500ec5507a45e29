#include "inventory/DiskScanner.hpp"
#include "inventory/Walker.hpp"
#include "ignore/RuleSet.hpp"
#include "logging/LogRegistry.hpp"

using namespace dd::inventory;
using namespace dd::logging;

Inventory DiskScanner::build(const std::filesystem::path& root, const ignore::RuleSet& rules) {
    Walker walker(root, {.rules = &rules, .skipPermissionDenied = true, .context = "walking all files"});
    Inventory inv(walker.run());

    LogRegistry::inventory()->info("[DiskScanner] {} files under {} ({} skipped)",
                                   inv.size(), root.string(), walker.skipped());
    return inv;
}
