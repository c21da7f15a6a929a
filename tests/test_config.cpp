/**
 * bashgate - service configuration tests
 */

#include <gtest/gtest.h>
#include <bashgate/core/config.hpp>
#include "test_helpers.hpp"

using namespace bashgate;
using bashgate::testing_support::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(config.load_string(
            "{"
            "  \"log_level\": \"debug\","
            "  \"watch_policy\": false,"
            "  \"executor\": { \"shell\": \"/bin/bash\", \"kill_grace_ms\": 250 },"
            "  \"dispatch\": { \"workers\": \"eight\" }"
            "}"));
    }

    Config config;
};

TEST_F(ConfigTest, DottedKeysReachNestedValues) {
    EXPECT_EQ(config.get_string("executor.shell", "/bin/sh"), "/bin/bash");
    EXPECT_EQ(config.get_int("executor.kill_grace_ms", 1000), 250);
    EXPECT_FALSE(config.get_bool("watch_policy", true));
    EXPECT_TRUE(config.has("executor.shell"));
}

TEST_F(ConfigTest, MissingKeysFallBackToDefaults) {
    EXPECT_EQ(config.get_string("policy_file", "policy.json"), "policy.json");
    EXPECT_EQ(config.get_int("executor.drain_ms", 200), 200);
    EXPECT_FALSE(config.has("executor.missing"));
    EXPECT_FALSE(config.has("log_level.nested"));
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    EXPECT_EQ(config.get_int("dispatch.workers", 4), 4);
    EXPECT_TRUE(config.get_bool("log_level", true));
}

TEST(ConfigLoadTest, RejectsNonObjectAndMalformedText) {
    Config config;
    EXPECT_FALSE(config.load_string("[1, 2, 3]"));
    EXPECT_FALSE(config.load_string("{ not json"));
}

TEST(ConfigLoadTest, LoadsFileAndRemembersPath) {
    TempDir dir;
    std::string path = dir.write("bashgate.json", "{\"log_level\": \"warn\"}");

    Config config;
    ASSERT_TRUE(config.load_file(path));
    EXPECT_EQ(config.path(), path);
    EXPECT_EQ(config.get_string("log_level", "info"), "warn");

    EXPECT_FALSE(config.load_file(dir.file("missing.json")));
}
