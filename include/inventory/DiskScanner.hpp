#pragma once

#include "inventory/Inventory.hpp"

#include <filesystem>

namespace dd::ignore {
class RuleSet;
}

namespace dd::inventory {

// Every non-ignored, non-directory entry under the installation root.
// Permission errors are logged and skipped; anything else throws.
struct DiskScanner {
    static Inventory build(const std::filesystem::path& root, const ignore::RuleSet& rules);
};

}
