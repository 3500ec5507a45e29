#pragma once

#include <string>
#include <vector>

namespace dd::inventory {

// Binary-search membership over a sorted, deduplicated list.
[[nodiscard]] bool sortedContains(const std::vector<std::string>& sorted, const std::string& path);

// Sorted, deduplicated set of root-relative paths. Immutable once built.
class Inventory {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

    Inventory() = default;
    explicit Inventory(std::vector<std::string> paths);

    [[nodiscard]] bool contains(const std::string& path) const { return sortedContains(paths_, path); }

    [[nodiscard]] const std::vector<std::string>& paths() const { return paths_; }
    [[nodiscard]] size_t size() const { return paths_.size(); }
    [[nodiscard]] bool empty() const { return paths_.empty(); }

    [[nodiscard]] const_iterator begin() const { return paths_.begin(); }
    [[nodiscard]] const_iterator end() const { return paths_.end(); }

private:
    std::vector<std::string> paths_;
};

}
