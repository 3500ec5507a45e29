#pragma once

#include "ignore/Rule.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dd::ignore {

// Flat, unordered collection of ignore rules. A path is ignored if any rule matches.
class RuleSet {
public:
    RuleSet() = default;

    // Loads every non-directory file below dir. An empty dir yields an empty set.
    // Throws std::runtime_error naming the failing step.
    static RuleSet loadFromDirectory(const std::filesystem::path& dir);

    void loadFile(const std::filesystem::path& file);

    // Blank lines and '#' comments are skipped. Returns true if a rule was added.
    bool addLine(const std::string& line);

    void add(std::unique_ptr<Rule> rule);

    [[nodiscard]] bool isIgnored(const std::string& path) const;

    [[nodiscard]] size_t size() const { return rules_.size(); }
    [[nodiscard]] bool empty() const { return rules_.empty(); }

private:
    std::vector<std::unique_ptr<Rule>> rules_;
};

}
