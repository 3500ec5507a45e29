#include "inventory/PackageScanner.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace dd::inventory;
using namespace dd::logging;
namespace fs = std::filesystem;

std::vector<fs::path> PackageScanner::manifests(const fs::path& root) {
    const auto infoDir = root / INFO_DIR;

    std::error_code ec;
    if (!fs::exists(infoDir, ec)) {
        if (ec) throw std::system_error(ec, "looking for dpkg info lists: " + infoDir.string());
        LogRegistry::inventory()->warn("[PackageScanner] No dpkg info directory at {}", infoDir.string());
        return {};
    }

    std::vector<fs::path> lists, conffiles;
    for (auto it = fs::directory_iterator(infoDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() == ".list") lists.push_back(p);
        else if (p.extension() == ".conffiles") conffiles.push_back(p);
    }
    if (ec) throw std::system_error(ec, "looking for dpkg info lists: " + infoDir.string());

    std::ranges::sort(lists);
    std::ranges::sort(conffiles);
    lists.insert(lists.end(), conffiles.begin(), conffiles.end());
    return lists;
}

size_t PackageScanner::readManifest(const fs::path& manifest, std::vector<std::string>& out) {
    std::ifstream in(manifest);
    if (!in) throw std::runtime_error("reading dpkg info file: failed to open " + manifest.string());

    size_t count = 0, unnormalized = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!util::isNormalizedPath(line)) ++unnormalized;
        out.push_back(line);
        ++count;
    }

    if (in.bad()) throw std::runtime_error("reading dpkg info file: read error on " + manifest.string());

    // Kept verbatim, but such entries can never match a walked path.
    if (unnormalized)
        LogRegistry::inventory()->warn("[PackageScanner] {} entries in {} are not normalized absolute paths",
                                       unnormalized, manifest.string());
    return count;
}

Inventory PackageScanner::build(const fs::path& root, std::vector<std::string> extra) {
    std::vector<std::string> paths = std::move(extra);

    const auto files = manifests(root);
    for (const auto& manifest : files) readManifest(manifest, paths);

    Inventory inv(std::move(paths));
    LogRegistry::inventory()->info("[PackageScanner] {} package paths from {} manifests", inv.size(), files.size());
    return inv;
}
