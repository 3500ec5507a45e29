#include "TempTree.hpp"
#include "ignore/RuleSet.hpp"

#include <stdexcept>

using namespace dd::ignore;
using dd::test::TempTreeTest;
namespace fs = std::filesystem;

class RuleSetTest : public TempTreeTest {};

TEST_F(RuleSetTest, EmptyDirectoryPathYieldsEmptySet) {
    const auto set = RuleSet::loadFromDirectory("");
    EXPECT_TRUE(set.empty());
    EXPECT_FALSE(set.isIgnored("/etc/passwd"));
}

TEST_F(RuleSetTest, LoadsEveryFileRecursivelySkippingComments) {
    writeFile(ignoreDir, "base", "# system noise\n/proc\n\n/sys\n");
    writeFile(ignoreDir, "nested/deeper/logs", "*.log\n#/var/cache\n");

    const auto set = RuleSet::loadFromDirectory(ignoreDir);
    ASSERT_EQ(set.size(), 3u);

    EXPECT_TRUE(set.isIgnored("/proc"));
    EXPECT_TRUE(set.isIgnored("/proc/1/status"));
    EXPECT_TRUE(set.isIgnored("/sys/kernel"));
    EXPECT_TRUE(set.isIgnored("/var/log/dpkg.log"));
    EXPECT_FALSE(set.isIgnored("/var/cache/apt"));
    EXPECT_FALSE(set.isIgnored("/processes"));
}

TEST_F(RuleSetTest, EmptyIgnoreDirectoryLoadsNothing) {
    const auto set = RuleSet::loadFromDirectory(ignoreDir);
    EXPECT_TRUE(set.empty());
}

TEST_F(RuleSetTest, MissingDirectoryIsALoadError) {
    try {
        (void)RuleSet::loadFromDirectory(base / "does-not-exist");
        FAIL() << "expected a load error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("walking ignore directory"), std::string::npos);
    }
}

TEST_F(RuleSetTest, InvalidGlobIsALoadError) {
    writeFile(ignoreDir, "broken", "/ok\n/etc/[unterminated\n");
    try {
        (void)RuleSet::loadFromDirectory(ignoreDir);
        FAIL() << "expected a load error";
    } catch (const std::runtime_error& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("invalid glob pattern"), std::string::npos);
        EXPECT_NE(msg.find(":2:"), std::string::npos);
    }
}

TEST_F(RuleSetTest, UnreadableRuleFileIsALoadError) {
    if (runningAsRoot()) GTEST_SKIP() << "permission bits do not apply to root";
    const auto file = writeFile(ignoreDir, "secret", "/etc\n");
    fs::permissions(file, fs::perms::none);
    EXPECT_THROW((void)RuleSet::loadFromDirectory(ignoreDir), std::runtime_error);
}

TEST_F(RuleSetTest, AddLineSkipsBlankAndCommentLines) {
    RuleSet set;
    EXPECT_FALSE(set.addLine(""));
    EXPECT_FALSE(set.addLine("# comment"));
    EXPECT_TRUE(set.addLine("/etc/foo"));
    EXPECT_TRUE(set.addLine("*.bak"));
    EXPECT_EQ(set.size(), 2u);

    EXPECT_TRUE(set.isIgnored("/etc/foo/bar"));
    EXPECT_TRUE(set.isIgnored("/home/user/x.bak"));
    EXPECT_FALSE(set.isIgnored("/etc/foobar"));
}

TEST_F(RuleSetTest, CrlfLineEndingsAreStripped) {
    writeFile(ignoreDir, "dos", "/var/log\r\n\r\n# note\r\n*.bak\r\n");

    const auto set = RuleSet::loadFromDirectory(ignoreDir);
    ASSERT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.isIgnored("/var/log/syslog"));
    EXPECT_TRUE(set.isIgnored("/home/user/x.bak"));
}
