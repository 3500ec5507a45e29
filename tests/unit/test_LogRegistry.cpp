#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dd::logging;

namespace {

const char* const subsystems[] = {"debdiff", "ignore", "inventory", "diff", "crypto", "alternatives"};

spdlog::level::level_enum configuredLevel(const std::string& name) {
    const auto& lv = dd::config::ConfigRegistry::get().logging.levels.subsystem_levels;
    if (name == "debdiff") return lv.debdiff;
    if (name == "ignore") return lv.ignore;
    if (name == "inventory") return lv.inventory;
    if (name == "diff") return lv.diff;
    if (name == "crypto") return lv.crypto;
    return lv.alternatives;
}

}

class LogRegistryTest : public ::testing::Test {
protected:
    void TearDown() override { LogRegistry::setSilent(false); }
};

TEST_F(LogRegistryTest, EverySubsystemIsRegistered) {
    ASSERT_TRUE(LogRegistry::isInitialized());
    for (const auto* name : subsystems) {
        const auto logger = LogRegistry::get(name);
        ASSERT_NE(logger, nullptr) << name;
        EXPECT_EQ(logger->name(), name);
        EXPECT_EQ(logger->level(), configuredLevel(name)) << name;
    }
    EXPECT_EQ(LogRegistry::crypto(), LogRegistry::get("crypto"));
}

TEST_F(LogRegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW((void)LogRegistry::get("no-such-subsystem"), std::runtime_error);
}

TEST_F(LogRegistryTest, SilentRaisesEveryLoggerToError) {
    LogRegistry::setSilent(true);
    for (const auto* name : subsystems) {
        EXPECT_EQ(LogRegistry::get(name)->level(), spdlog::level::err) << name;
        EXPECT_FALSE(LogRegistry::get(name)->should_log(spdlog::level::warn)) << name;
        EXPECT_TRUE(LogRegistry::get(name)->should_log(spdlog::level::err)) << name;
    }
}

TEST_F(LogRegistryTest, LeavingSilentRestoresConfiguredLevels) {
    LogRegistry::setSilent(true);
    LogRegistry::setSilent(false);
    for (const auto* name : subsystems)
        EXPECT_EQ(LogRegistry::get(name)->level(), configuredLevel(name)) << name;
}
