#include "diff/Report.hpp"

#include <nlohmann/json.hpp>

namespace dd::diff {

std::string renderPlain(const Context& ctx) {
    std::string out;
    for (const auto& path : ctx.unpackaged) {
        out += path;
        out += '\n';
    }

    if (ctx.divergent) {
        for (const auto& path : *ctx.divergent) {
            out += "M ";
            out += path;
            out += '\n';
        }
    }

    return out;
}

void to_json(nlohmann::json& j, const Context& ctx) {
    j = {{"unpackaged", ctx.unpackaged}};
    if (ctx.divergent) j["divergent"] = *ctx.divergent;
}

}
