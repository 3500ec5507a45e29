#pragma once

#include "diff/Context.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dd::diff {

// Unpackaged paths one per line, then divergent paths as "M <path>" when that pass ran.
std::string renderPlain(const Context& ctx);

// {"unpackaged": [...], "divergent": [...]}; "divergent" only when that pass ran.
void to_json(nlohmann::json& j, const Context& ctx);

}
