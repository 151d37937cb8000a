#include <gtest/gtest.h>
#include "redirect_log.hpp"
#include "utils/test_utils.hpp"
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override { TestUtils::removeFile("relog_config_test.json"); }
};

// --- MemoryConfiguration ---

TEST_F(ConfigurationTest, MemoryKeysAreCaseInsensitive) {
    relog::MemoryConfiguration config{{"Logging:Console:IncludeScopes", "true"}};
    std::string value;
    ASSERT_TRUE(config.tryGet("logging:console:includescopes", value));
    EXPECT_EQ(value, "true");
    EXPECT_FALSE(config.tryGet("Logging:IncludeScopes", value));
}

TEST_F(ConfigurationTest, GetBoolAcceptsAnyCase) {
    relog::MemoryConfiguration config;
    config.set("a", "True").set("b", " FALSE ").set("c", "yes").set("d", "");

    bool value = false;
    ASSERT_TRUE(relog::getBool(config, "a", value));
    EXPECT_TRUE(value);
    ASSERT_TRUE(relog::getBool(config, "b", value));
    EXPECT_FALSE(value);
    EXPECT_FALSE(relog::getBool(config, "c", value));
    EXPECT_FALSE(relog::getBool(config, "d", value));
    EXPECT_FALSE(relog::getBool(config, "missing", value));
}

// --- JsonConfiguration ---

TEST_F(ConfigurationTest, JsonNestedObjectsBecomePaths) {
    auto config = relog::JsonConfiguration::fromString(R"({
        "Logging": {
            "IncludeScopes": false,
            "Console": { "IncludeScopes": true, "FormatterName": "simple" },
            "LogLevel": { "Default": "Information" }
        }
    })");

    std::string value;
    ASSERT_TRUE(config.tryGet("Logging:Console:IncludeScopes", value));
    EXPECT_EQ(value, "true");
    ASSERT_TRUE(config.tryGet("Logging:IncludeScopes", value));
    EXPECT_EQ(value, "false");
    ASSERT_TRUE(config.tryGet("LOGGING:LOGLEVEL:DEFAULT", value));
    EXPECT_EQ(value, "Information");
    EXPECT_FALSE(config.tryGet("Logging:Console", value));
}

TEST_F(ConfigurationTest, JsonArraysNumbersAndNulls) {
    auto config = relog::JsonConfiguration::fromString(
        R"({"Servers": [{"Port": 8080}, {"Port": 8081}], "Timeout": 2.5, "Proxy": null})");

    std::string value;
    ASSERT_TRUE(config.tryGet("Servers:1:Port", value));
    EXPECT_EQ(value, "8081");
    ASSERT_TRUE(config.tryGet("Timeout", value));
    EXPECT_EQ(value, "2.5");
    EXPECT_FALSE(config.tryGet("Proxy", value));
}

TEST_F(ConfigurationTest, JsonStringBooleansReadAsBool) {
    auto config = relog::JsonConfiguration::fromString(R"({"Logging": {"IncludeScopes": "True"}})");
    bool value = false;
    ASSERT_TRUE(relog::getBool(config, "Logging:IncludeScopes", value));
    EXPECT_TRUE(value);
}

TEST_F(ConfigurationTest, MalformedJsonThrows) {
    EXPECT_THROW(relog::JsonConfiguration::fromString("{ \"Logging\": "), std::runtime_error);
}

TEST_F(ConfigurationTest, NonObjectRootThrows) {
    EXPECT_THROW(relog::JsonConfiguration::fromString("[1, 2, 3]"), std::runtime_error);
}

TEST_F(ConfigurationTest, JsonFromFile) {
    TestUtils::writeFile("relog_config_test.json", R"({"Logging": {"Console": {"IncludeScopes": true}}})");
    auto config = relog::JsonConfiguration::fromFile("relog_config_test.json");
    bool value = false;
    ASSERT_TRUE(relog::getBool(config, "Logging:Console:IncludeScopes", value));
    EXPECT_TRUE(value);
}

TEST_F(ConfigurationTest, MissingFileThrows) {
    EXPECT_THROW(relog::JsonConfiguration::fromFile("relog_no_such_file.json"), std::runtime_error);
}

// --- EnvironmentConfiguration ---

TEST_F(ConfigurationTest, EnvironmentDoubleUnderscoreSeparatesSections) {
    ASSERT_EQ(setenv("RELOGTEST_Logging__Console__IncludeScopes", "true", 1), 0);
    relog::EnvironmentConfiguration config("RELOGTEST_");
    unsetenv("RELOGTEST_Logging__Console__IncludeScopes");

    bool value = false;
    ASSERT_TRUE(relog::getBool(config, "Logging:Console:IncludeScopes", value));
    EXPECT_TRUE(value);
}

TEST_F(ConfigurationTest, EnvironmentPrefixFiltersVariables) {
    ASSERT_EQ(setenv("RELOGOTHER_Logging__IncludeScopes", "true", 1), 0);
    relog::EnvironmentConfiguration config("RELOGTEST_");
    unsetenv("RELOGOTHER_Logging__IncludeScopes");

    std::string value;
    EXPECT_FALSE(config.tryGet("Logging:IncludeScopes", value));
    EXPECT_FALSE(config.tryGet("RELOGOTHER_Logging:IncludeScopes", value));
}

TEST_F(ConfigurationTest, EnvironmentIsSnapshotAtConstruction) {
    relog::EnvironmentConfiguration config("RELOGLATE_");
    ASSERT_EQ(setenv("RELOGLATE_Key", "value", 1), 0);
    std::string value;
    EXPECT_FALSE(config.tryGet("Key", value));
    unsetenv("RELOGLATE_Key");
}

// --- ConfigurationRoot ---

TEST_F(ConfigurationTest, LaterSourceWins) {
    auto base = std::make_shared<relog::MemoryConfiguration>();
    base->set("Logging:IncludeScopes", "false").set("Only:Base", "1");
    auto overrides = std::make_shared<relog::MemoryConfiguration>();
    overrides->set("Logging:IncludeScopes", "true");

    relog::ConfigurationRoot root;
    root.add(base).add(overrides).add(nullptr);
    EXPECT_EQ(root.sourceCount(), 2u);

    std::string value;
    ASSERT_TRUE(root.tryGet("Logging:IncludeScopes", value));
    EXPECT_EQ(value, "true");
    ASSERT_TRUE(root.tryGet("Only:Base", value));
    EXPECT_EQ(value, "1");
    EXPECT_FALSE(root.tryGet("Nowhere", value));
}
