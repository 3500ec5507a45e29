#include "ignore/RuleSet.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace dd::ignore;
using namespace dd::logging;
namespace fs = std::filesystem;

RuleSet RuleSet::loadFromDirectory(const fs::path& dir) {
    RuleSet set;
    if (dir.empty()) return set;

    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            if (entry.is_directory()) continue;
            files.push_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("walking ignore directory: ") + e.what());
    }

    std::ranges::sort(files);
    for (const auto& file : files) set.loadFile(file);

    LogRegistry::ignore()->debug("[RuleSet] Loaded {} rules from {} files under {}",
                                 set.size(), files.size(), dir.string());
    return set;
}

void RuleSet::loadFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("reading ignore file: failed to open " + file.string());

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        try {
            addLine(line);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("invalid glob pattern in " + file.string() + ":" +
                                     std::to_string(lineNo) + ": " + e.what());
        }
    }

    if (in.bad()) throw std::runtime_error("reading ignore file: read error on " + file.string());
}

bool RuleSet::addLine(const std::string& line) {
    if (line.empty() || line.front() == '#') return false;
    add(makeRule(line));
    return true;
}

void RuleSet::add(std::unique_ptr<Rule> rule) {
    if (!rule) return;
    rules_.push_back(std::move(rule));
}

bool RuleSet::isIgnored(const std::string& path) const {
    return std::ranges::any_of(rules_, [&](const auto& rule) { return rule->match(path); });
}
