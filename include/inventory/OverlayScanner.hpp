#pragma once

#include "inventory/Inventory.hpp"

#include <filesystem>

namespace dd::inventory {

// Every non-directory entry under the overlay (repo) directory, in
// root-relative form. Any walk error is fatal, permission errors included.
struct OverlayScanner {
    static Inventory build(const std::filesystem::path& repo);
};

}
