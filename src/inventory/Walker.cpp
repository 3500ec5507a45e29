#include "inventory/Walker.hpp"
#include "ignore/RuleSet.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <utility>

using namespace dd::inventory;
using namespace dd::logging;
using namespace dd::util;
namespace fs = std::filesystem;

bool dd::inventory::isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

Walker::Walker(fs::path base, Options options)
    : base_(std::move(base)), baseStr_(base_.string()), options_(std::move(options)) {}

std::vector<std::string> Walker::run() {
    files_.clear();
    skipped_ = 0;

    std::error_code ec;
    const auto status = fs::status(base_, ec);
    if (ec) {
        handleError(ec, base_);
        return files_;
    }

    visit(base_, status);
    return std::move(files_);
}

void Walker::visit(const fs::path& path, const fs::file_status& status) {
    const auto rel = relativeTo(baseStr_, path.string());

    if (isIgnored(rel)) {
        LogRegistry::inventory()->trace("[Walker] Ignoring {}", rel);
        return;
    }

    if (fs::is_directory(status)) {
        walkDirectory(path);
        return;
    }

    files_.push_back(rel);
}

void Walker::walkDirectory(const fs::path& dir) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;

    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
        entries.push_back(*it);

    if (ec) {
        handleError(ec, dir);
        return;
    }

    std::ranges::sort(entries, {}, [](const fs::directory_entry& e) -> const fs::path& { return e.path(); });

    for (const auto& entry : entries) {
        const auto status = entry.symlink_status(ec);
        if (ec) {
            handleError(ec, entry.path());
            ec.clear();
            continue;
        }
        visit(entry.path(), status);
    }
}

void Walker::handleError(const std::error_code& ec, const fs::path& path) {
    if (options_.skipPermissionDenied && isPermissionError(ec)) {
        ++skipped_;
        LogRegistry::inventory()->warn("[Walker] Skipping file: {}: {}", path.string(), ec.message());
        return;
    }
    throw std::system_error(ec, options_.context + ": " + path.string());
}

bool Walker::isIgnored(const std::string& rel) const {
    return options_.rules && options_.rules->isIgnored(rel);
}
