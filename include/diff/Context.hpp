#pragma once

#include "config/Config.hpp"
#include "ignore/RuleSet.hpp"
#include "inventory/Inventory.hpp"

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace dd::diff {

// Everything one run accumulates. Each stage takes the context by value and returns it.
struct Context {
    config::DiffConfig settings;

    ignore::RuleSet ignoreRules;
    inventory::Inventory disk;
    inventory::Inventory overlay;
    inventory::Inventory packages;

    std::vector<std::string> unpackaged;
    std::optional<std::vector<std::string>> divergent;   // set only when the pass ran

    Context() = default;
    explicit Context(config::DiffConfig settings) : settings(std::move(settings)) {}
};

}
