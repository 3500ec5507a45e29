#include "ignore/Rule.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace dd::ignore;

LiteralRule::LiteralRule(std::string prefix) : prefix_(std::move(prefix)) {}

bool LiteralRule::match(const std::string& path) const {
    if (path.size() < prefix_.size()) return false;
    if (path.compare(0, prefix_.size(), prefix_) != 0) return false;
    return path.size() == prefix_.size() || path[prefix_.size()] == '/';
}

GlobRule::GlobRule(std::string pattern) : pattern_(std::move(pattern)) {
    try {
        tokens_ = compile(pattern_);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("invalid glob pattern '" + pattern_ + "': " + e.what());
    }
}

bool GlobRule::Token::matches(const char c) const {
    switch (kind) {
    case Kind::Literal: return c == ch;
    case Kind::Any: return true;
    case Kind::Class: {
        const auto u = static_cast<unsigned char>(c);
        const bool in = std::ranges::any_of(ranges, [u](const auto& r) { return r.first <= u && u <= r.second; });
        return in != negated;
    }
    case Kind::Star: break;
    }
    return false;
}

// Single backtrack point: a later '*' always subsumes an earlier one.
bool GlobRule::match(const std::string& path) const {
    constexpr size_t none = static_cast<size_t>(-1);
    const size_t n = tokens_.size();
    size_t p = 0, s = 0, star = none, mark = 0;

    while (s < path.size()) {
        if (p < n && tokens_[p].kind == Token::Kind::Star) {
            star = p++;
            mark = s;
        } else if (p < n && tokens_[p].matches(path[s])) {
            ++p;
            ++s;
        } else if (star != none) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }

    while (p < n && tokens_[p].kind == Token::Kind::Star) ++p;
    return p == n;
}

std::vector<GlobRule::Token> GlobRule::compile(const std::string_view glob) {
    std::vector<Token> tokens;
    tokens.reserve(glob.size());

    for (size_t i = 0; i < glob.size();) {
        Token tok;
        switch (const char c = glob[i]) {
        case '*':
            while (i < glob.size() && glob[i] == '*') ++i;
            tok.kind = Token::Kind::Star;
            break;
        case '?':
            tok.kind = Token::Kind::Any;
            ++i;
            break;
        case '[':
            tok.kind = Token::Kind::Class;
            i = compileClass(glob, i, tok);
            break;
        case '\\':
            if (i + 1 >= glob.size()) throw std::invalid_argument("trailing escape");
            tok.ch = glob[i + 1];
            i += 2;
            break;
        default:
            tok.ch = c;
            ++i;
        }
        tokens.push_back(std::move(tok));
    }

    return tokens;
}

// Parses the bracket expression at glob[i] == '['. Returns the index past ']'.
size_t GlobRule::compileClass(const std::string_view glob, const size_t i, Token& out) {
    const auto unterminated = [i] {
        return std::invalid_argument("unterminated character class at offset " + std::to_string(i));
    };

    size_t j = i + 1;
    if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
        out.negated = true;
        ++j;
    }

    // Reads one member, honouring '\' escapes. Returns false on ']' or end of pattern.
    const auto member = [&](unsigned char& c, const bool first) {
        if (j >= glob.size()) throw unterminated();
        if (glob[j] == ']' && !first) return false;
        if (glob[j] == '\\') {
            if (++j >= glob.size()) throw unterminated();
        }
        c = static_cast<unsigned char>(glob[j++]);
        return true;
    };

    // A ']' directly after the opening bracket is a member, not the terminator.
    bool first = true;
    for (unsigned char lo = 0; member(lo, first); first = false) {
        unsigned char hi = lo;
        if (j + 1 < glob.size() && glob[j] == '-' && glob[j + 1] != ']') {
            ++j;
            member(hi, false);
            if (hi < lo) throw std::invalid_argument("reversed range in character class at offset " + std::to_string(i));
        }
        out.ranges.emplace_back(lo, hi);
    }

    return j + 1;
}

bool dd::ignore::isGlobPattern(const std::string_view line) {
    return line.find_first_of("*?[") != std::string_view::npos;
}

std::unique_ptr<Rule> dd::ignore::makeRule(const std::string& line) {
    if (isGlobPattern(line)) return std::make_unique<GlobRule>(line);
    return std::make_unique<LiteralRule>(line);
}
