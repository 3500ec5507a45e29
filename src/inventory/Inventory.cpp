#include "inventory/Inventory.hpp"

#include <algorithm>
#include <utility>

namespace dd::inventory {

bool sortedContains(const std::vector<std::string>& sorted, const std::string& path) {
    // lower_bound yields the insertion point; membership needs equality there
    const auto it = std::lower_bound(sorted.begin(), sorted.end(), path);
    return it != sorted.end() && *it == path;
}

Inventory::Inventory(std::vector<std::string> paths) : paths_(std::move(paths)) {
    std::ranges::sort(paths_);
    const auto [first, last] = std::ranges::unique(paths_);
    paths_.erase(first, last);
}

}
