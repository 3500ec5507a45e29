#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dd::ignore {

struct Rule {
    virtual ~Rule() = default;

    [[nodiscard]] virtual bool match(const std::string& path) const = 0;
    [[nodiscard]] virtual const std::string& pattern() const = 0;
    [[nodiscard]] virtual bool isGlob() const = 0;
};

// Matches the path itself and everything nested below it.
class LiteralRule final : public Rule {
public:
    explicit LiteralRule(std::string prefix);

    [[nodiscard]] bool match(const std::string& path) const override;
    [[nodiscard]] const std::string& pattern() const override { return prefix_; }
    [[nodiscard]] bool isGlob() const override { return false; }

private:
    std::string prefix_;
};

// Shell-style glob over the whole path. '*' and '?' also match '/'.
// Braces have no special meaning.
class GlobRule final : public Rule {
public:
    // Throws std::invalid_argument when the pattern does not compile.
    explicit GlobRule(std::string pattern);

    // Iterative, runs in O(pattern * path) without recursion.
    [[nodiscard]] bool match(const std::string& path) const override;
    [[nodiscard]] const std::string& pattern() const override { return pattern_; }
    [[nodiscard]] bool isGlob() const override { return true; }

private:
    struct Token {
        enum class Kind { Literal, Any, Star, Class };

        Kind kind = Kind::Literal;
        char ch = 0;
        bool negated = false;
        std::vector<std::pair<unsigned char, unsigned char>> ranges;

        [[nodiscard]] bool matches(char c) const;
    };

    static std::vector<Token> compile(std::string_view glob);
    static size_t compileClass(std::string_view glob, size_t i, Token& out);

    std::string pattern_;
    std::vector<Token> tokens_;
};

[[nodiscard]] bool isGlobPattern(std::string_view line);

// Classifies once: any of "*?[" makes a glob, anything else a literal prefix.
std::unique_ptr<Rule> makeRule(const std::string& line);

}
