#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace dd::ignore {
class RuleSet;
}

namespace dd::inventory {

[[nodiscard]] bool isPermissionError(const std::error_code& ec);

// Recursive, non-following walk that records every non-directory entry in
// base-relative form ("/etc/hosts"). Directories are descended, never recorded.
class Walker {
public:
    struct Options {
        const ignore::RuleSet* rules = nullptr;   // matched against the base-relative path
        bool skipPermissionDenied = false;
        std::string context = "walking files";    // prefix for thrown errors
    };

    Walker(std::filesystem::path base, Options options);

    // Throws std::system_error on any error the options do not tolerate.
    std::vector<std::string> run();

    [[nodiscard]] size_t skipped() const { return skipped_; }

private:
    std::filesystem::path base_;
    std::string baseStr_;
    Options options_;
    std::vector<std::string> files_;
    size_t skipped_ = 0;

    void walkDirectory(const std::filesystem::path& dir);
    void visit(const std::filesystem::path& path, const std::filesystem::file_status& status);

    // Returns normally when the error is tolerated, throws otherwise.
    void handleError(const std::error_code& ec, const std::filesystem::path& path);

    [[nodiscard]] bool isIgnored(const std::string& rel) const;
};

}
