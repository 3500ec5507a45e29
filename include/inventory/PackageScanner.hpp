#pragma once

#include "inventory/Inventory.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dd::inventory {

// Paths owned by installed packages, read from dpkg's file-list manifests.
struct PackageScanner {
    static constexpr const char* INFO_DIR = "var/lib/dpkg/info";

    // All *.list manifests followed by all *.conffiles manifests, each group sorted.
    static std::vector<std::filesystem::path> manifests(const std::filesystem::path& root);

    // Appends every non-empty line of the manifest verbatim. Returns the line count.
    static size_t readManifest(const std::filesystem::path& manifest, std::vector<std::string>& out);

    // extra paths (alternatives links) join the manifest entries before sorting
    static Inventory build(const std::filesystem::path& root, std::vector<std::string> extra = {});
};

}
