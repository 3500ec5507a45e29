#include <gtest/gtest.h>
#include "ignore/Rule.hpp"

#include <stdexcept>

using namespace dd::ignore;

TEST(LiteralRuleTest, MatchesItselfAndNestedPaths) {
    const LiteralRule rule("/etc/foo");
    EXPECT_TRUE(rule.match("/etc/foo"));
    EXPECT_TRUE(rule.match("/etc/foo/bar"));
    EXPECT_TRUE(rule.match("/etc/foo/bar/baz.conf"));
}

TEST(LiteralRuleTest, DoesNotMatchSiblingWithSharedPrefix) {
    const LiteralRule rule("/etc/foo");
    EXPECT_FALSE(rule.match("/etc/foobar"));
    EXPECT_FALSE(rule.match("/etc/fo"));
    EXPECT_FALSE(rule.match("/etc"));
    EXPECT_FALSE(rule.match("/var/etc/foo"));
}

TEST(GlobRuleTest, StarMatchesAcrossSeparators) {
    const GlobRule rule("*.bak");
    EXPECT_TRUE(rule.match("/home/user/x.bak"));
    EXPECT_TRUE(rule.match("/x.bak"));
    EXPECT_TRUE(rule.match("/a/b/c/.bak"));
    EXPECT_FALSE(rule.match("/home/user/x.bak2"));
    EXPECT_FALSE(rule.match("/home/user/xbak"));
}

TEST(GlobRuleTest, MatchesTheWholePath) {
    const GlobRule rule("/var/cache/*");
    EXPECT_TRUE(rule.match("/var/cache/apt/pkgcache.bin"));
    EXPECT_FALSE(rule.match("/srv/var/cache/x"));
}

TEST(GlobRuleTest, QuestionMarkMatchesExactlyOneCharacter) {
    const GlobRule rule("/etc/?oo");
    EXPECT_TRUE(rule.match("/etc/foo"));
    EXPECT_TRUE(rule.match("/etc/zoo"));
    EXPECT_FALSE(rule.match("/etc/oo"));
    EXPECT_FALSE(rule.match("/etc/fooo"));
}

TEST(GlobRuleTest, CharacterClassesAndNegation) {
    const GlobRule range("/var/log/syslog.[0-9]");
    EXPECT_TRUE(range.match("/var/log/syslog.1"));
    EXPECT_FALSE(range.match("/var/log/syslog.a"));

    const GlobRule negated("/tmp/[!a]*");
    EXPECT_TRUE(negated.match("/tmp/b.txt"));
    EXPECT_FALSE(negated.match("/tmp/a.txt"));

    const GlobRule caret("/tmp/[^a]*");
    EXPECT_FALSE(caret.match("/tmp/a.txt"));
    EXPECT_TRUE(caret.match("/tmp/c.txt"));
}

TEST(GlobRuleTest, BracketFirstInClassIsLiteral) {
    const GlobRule rule("/x/[]a]");
    EXPECT_TRUE(rule.match("/x/]"));
    EXPECT_TRUE(rule.match("/x/a"));
    EXPECT_FALSE(rule.match("/x/b"));
}

TEST(GlobRuleTest, OtherPunctuationIsLiteral) {
    const GlobRule rule("/etc/a+b(c)*.conf");
    EXPECT_TRUE(rule.match("/etc/a+b(c)1.conf"));
    EXPECT_FALSE(rule.match("/etc/aab(c)1.conf"));
    EXPECT_FALSE(rule.match("/etc/a+b(c)1xconf"));
}

TEST(GlobRuleTest, BackslashEscapesSpecialCharacters) {
    const GlobRule rule(R"(/srv/\*weird*)");
    EXPECT_TRUE(rule.match("/srv/*weird-name"));
    EXPECT_FALSE(rule.match("/srv/xweird-name"));
}

TEST(GlobRuleTest, EscapesInsideClass) {
    const GlobRule bracket("/x/[\\]]");
    EXPECT_TRUE(bracket.match("/x/]"));
    EXPECT_FALSE(bracket.match("/x/\\"));

    const GlobRule dash("/x/[a\\-z]");
    EXPECT_TRUE(dash.match("/x/-"));
    EXPECT_TRUE(dash.match("/x/a"));
    EXPECT_TRUE(dash.match("/x/z"));
    EXPECT_FALSE(dash.match("/x/b"));
}

TEST(GlobRuleTest, BracesAreLiteral) {
    const GlobRule rule("/etc/{foo,bar}*");
    EXPECT_TRUE(rule.match("/etc/{foo,bar}.conf"));
    EXPECT_FALSE(rule.match("/etc/foo.conf"));
    EXPECT_FALSE(rule.match("/etc/bar1"));
}

TEST(GlobRuleTest, LongPathsDoNotExhaustTheStack) {
    const GlobRule rule("*.bak");
    const std::string longName = "/" + std::string(100000, 'a');
    EXPECT_FALSE(rule.match(longName));
    EXPECT_TRUE(rule.match(longName + ".bak"));

    const GlobRule stars("/*a*a*a*b");
    EXPECT_FALSE(stars.match(longName));
}

TEST(GlobRuleTest, UnterminatedClassFailsToCompile) {
    EXPECT_THROW(GlobRule("/etc/[abc"), std::invalid_argument);
    EXPECT_THROW(GlobRule("/etc/[a\\"), std::invalid_argument);
    EXPECT_THROW(GlobRule("/etc/*\\"), std::invalid_argument);
    EXPECT_THROW(GlobRule("/etc/[z-a]"), std::invalid_argument);
}

TEST(RuleFactoryTest, ClassifiesOnSpecialCharacters) {
    EXPECT_TRUE(isGlobPattern("*.bak"));
    EXPECT_TRUE(isGlobPattern("/etc/?"));
    EXPECT_TRUE(isGlobPattern("/etc/[ab]"));
    EXPECT_FALSE(isGlobPattern("/etc/foo"));
    EXPECT_FALSE(isGlobPattern("/etc/{a,b}"));

    EXPECT_TRUE(makeRule("/var/*.log")->isGlob());
    const auto literal = makeRule("/var/log");
    EXPECT_FALSE(literal->isGlob());
    EXPECT_EQ(literal->pattern(), "/var/log");
}
