// debdiff: lists files on an apt/dpkg system that neither an installed package
// nor the overlay (repo) directory accounts for.

#include "cli/Args.hpp"
#include "config/ConfigRegistry.hpp"
#include "diff/Engine.hpp"
#include "diff/Report.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace dd::cli;
using namespace dd::config;
using namespace dd::diff;
using namespace dd::logging;

int main(int argc, char** argv) {
    CommandCall call;
    bool help = false;
    try {
        call = parseArgs(argc, argv);
        help = hasFlag(call, "help");
    } catch (const ArgsError& e) {
        fmt::print(stderr, "debdiff: {}\n{}", e.what(), usage(argc > 0 ? argv[0] : ""));
        return 2;
    }

    if (help) {
        fmt::print("{}", usage(call.name));
        return EXIT_SUCCESS;
    }

    try {
        auto cfg = resolveConfig(call);
        applyOverrides(call, cfg);

        ConfigRegistry::init(cfg);
        LogRegistry::init();

        if (hasFlag(call, "print-config")) {
            const nlohmann::json j = ConfigRegistry::get();
            fmt::print("{}\n", j.dump(2));
            return EXIT_SUCCESS;
        }

        LogRegistry::debdiff()->debug("[*] Auditing {} against {}", cfg.diff.root.string(), cfg.diff.repo.string());

        const auto ctx = Engine(ConfigRegistry::get().diff).run();

        if (hasFlag(call, "json")) {
            const nlohmann::json j = ctx;
            fmt::print("{}\n", j.dump(2));
        } else {
            fmt::print("{}", renderPlain(ctx));
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::debdiff()->error("[-] {}", e.what());
        else fmt::print(stderr, "debdiff: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
