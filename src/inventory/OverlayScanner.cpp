#include "inventory/OverlayScanner.hpp"
#include "inventory/Walker.hpp"
#include "logging/LogRegistry.hpp"

using namespace dd::inventory;
using namespace dd::logging;

Inventory OverlayScanner::build(const std::filesystem::path& repo) {
    Walker walker(repo, {.rules = nullptr, .skipPermissionDenied = false, .context = "walking repo files"});
    Inventory inv(walker.run());

    LogRegistry::inventory()->info("[OverlayScanner] {} files under {}", inv.size(), repo.string());
    return inv;
}
