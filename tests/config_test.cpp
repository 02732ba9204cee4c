#include "core/config.h"
#include "test_fonts.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

TEST(ConfigTest, DefaultsValidate) {
    ShoutConfig cfg;
    std::string error;
    EXPECT_TRUE(validateConfig(cfg, error)) << error;
    EXPECT_EQ(cfg.server.publicPort, 8080);
    EXPECT_EQ(cfg.streaming.maxConcurrentStreams, 100);
    EXPECT_EQ(cfg.fonts.defaultFont, "standard");
}

TEST(ConfigTest, ValidationCatchesBadValues) {
    std::string error;

    ShoutConfig badPort;
    badPort.server.publicPort = 70000;
    EXPECT_FALSE(validateConfig(badPort, error));
    EXPECT_NE(error.find("invalid port"), std::string::npos);

    ShoutConfig badTimeouts;
    badTimeouts.streaming.maxTimeout = std::chrono::seconds(5);
    EXPECT_FALSE(validateConfig(badTimeouts, error));

    ShoutConfig badSpeed;
    badSpeed.streaming.defaultSpeed = 11;
    EXPECT_FALSE(validateConfig(badSpeed, error));

    ShoutConfig badStreams;
    badStreams.streaming.maxConcurrentStreams = 0;
    EXPECT_FALSE(validateConfig(badStreams, error));

    ShoutConfig badAlign;
    badAlign.text.defaultAlign = "middle";
    EXPECT_FALSE(validateConfig(badAlign, error));
}

class ConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("SHOUT_SERVER_PUBLIC_PORT");
        unsetenv("SHOUT_STREAMING_MAX_TIMEOUT");
        unsetenv("SHOUT_FONTS_ALLOWED");
        unsetenv("SHOUT_TEXT_DEFAULT_BORDER");
    }
};

TEST_F(ConfigEnvTest, EnvironmentOverridesDefaults) {
    setenv("SHOUT_SERVER_PUBLIC_PORT", "9000", 1);
    setenv("SHOUT_STREAMING_MAX_TIMEOUT", "60", 1);
    setenv("SHOUT_FONTS_ALLOWED", "standard, doom ,,slant", 1);
    setenv("SHOUT_TEXT_DEFAULT_BORDER", "rounded", 1);

    ShoutConfig cfg;
    std::string error;
    ASSERT_TRUE(applyEnvironment(cfg, error)) << error;
    EXPECT_EQ(cfg.server.publicPort, 9000);
    EXPECT_EQ(cfg.streaming.maxTimeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.fonts.allowed, (std::vector<std::string>{"standard", "doom", "slant"}));
    EXPECT_EQ(cfg.text.defaultBorder, "rounded");
}

TEST_F(ConfigEnvTest, NonIntegerEnvironmentValueFails) {
    setenv("SHOUT_SERVER_PUBLIC_PORT", "80a", 1);
    ShoutConfig cfg;
    std::string error;
    EXPECT_FALSE(applyEnvironment(cfg, error));
    EXPECT_NE(error.find("SHOUT_SERVER_PUBLIC_PORT"), std::string::npos);
    EXPECT_EQ(cfg.server.publicPort, 8080);
}

class ConfigFileTest : public FontDirTest {
protected:
    std::string writeConfig(const std::string& contents) {
        std::string path = (dir_ / "shout.json").string();
        std::ofstream out(path);
        out << contents;
        return path;
    }
};

TEST_F(ConfigFileTest, FileOverridesOnlyGivenKeys) {
    std::string path = writeConfig(R"({
        "server": {"publicPort": 8181},
        "streaming": {"maxConcurrentStreams": 2, "defaultTimeout": 10},
        "fonts": {"allowed": ["standard"]}
    })");
    ShoutConfig cfg;
    std::string error;
    ASSERT_TRUE(loadConfigFile(path, cfg, error)) << error;
    EXPECT_EQ(cfg.server.publicPort, 8181);
    EXPECT_EQ(cfg.server.adminPort, 9090);
    EXPECT_EQ(cfg.streaming.maxConcurrentStreams, 2);
    EXPECT_EQ(cfg.streaming.defaultTimeout, std::chrono::seconds(10));
    EXPECT_EQ(cfg.fonts.allowed, std::vector<std::string>{"standard"});
}

TEST_F(ConfigFileTest, MalformedFileFails) {
    std::string path = writeConfig("{ not json");
    ShoutConfig cfg;
    std::string error;
    EXPECT_FALSE(loadConfigFile(path, cfg, error));
    EXPECT_NE(error.find("Invalid config file"), std::string::npos);
}

TEST_F(ConfigFileTest, WrongTypeFails) {
    std::string path = writeConfig(R"({"server": {"publicPort": "eighty"}})");
    ShoutConfig cfg;
    std::string error;
    EXPECT_FALSE(loadConfigFile(path, cfg, error));
}

TEST_F(ConfigFileTest, MissingFileFails) {
    ShoutConfig cfg;
    std::string error;
    EXPECT_FALSE(loadConfigFile((dir_ / "absent.json").string(), cfg, error));
    EXPECT_NE(error.find("Could not open"), std::string::npos);
}
