#include <gtest/gtest.h>
#include "TestBundle.hpp"
#include "models/Config.hpp"
#include <cstdlib>

using namespace Durak;
using DurakTest::TempBundle;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"DURAK_METADATA_PATH", "DURAK_DEFAULT_RESOURCE",
                                 "DURAK_LOG_LEVEL", "DURAK_LOG_DIR"}) {
            unsetenv(name);
        }
        getConfig().reset();
    }

    TempBundle bundle;
};

TEST_F(ConfigTest, DefaultsPointAtBundledResources) {
    auto& config = getConfig();
    EXPECT_EQ(config.defaultResource, "base/turkish");
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.logDirectory.empty());
    EXPECT_EQ(config.metadataPath.filename(), "metadata.json");
    EXPECT_TRUE(std::filesystem::exists(config.metadataPath));
}

TEST_F(ConfigTest, LoadsJsonFile) {
    auto path = bundle.write("durak.json", R"({
        "metadata_path": "resources/metadata.json",
        "default_resource": "domains/social_media",
        "log_level": "debug",
        "log_directory": "/tmp/durak-logs"
    })");

    auto& config = getConfig();
    ASSERT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.metadataPath, bundle.path() / "resources" / "metadata.json");
    EXPECT_EQ(config.defaultResource, "domains/social_media");
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.logDirectory, "/tmp/durak-logs");
}

TEST_F(ConfigTest, AbsoluteMetadataPathIsKept) {
    auto path = bundle.write("durak.json", R"({"metadata_path": "/srv/durak/metadata.json"})");

    ASSERT_TRUE(getConfig().loadFromFile(path.string()));
    EXPECT_EQ(getConfig().metadataPath, std::filesystem::path("/srv/durak/metadata.json"));
}

TEST_F(ConfigTest, RejectsUnreadableOrMalformedFiles) {
    auto& config = getConfig();
    EXPECT_FALSE(config.loadFromFile((bundle.path() / "missing.json").string()));
    EXPECT_FALSE(config.loadFromFile(bundle.write("bad.json", "{ nope").string()));
    EXPECT_FALSE(config.loadFromFile(bundle.write("array.json", "[]").string()));
    EXPECT_FALSE(config.loadFromFile(bundle.write("type.json", R"({"default_resource": 5})").string()));
    EXPECT_FALSE(config.loadFromFile(bundle.write("level.json", R"({"log_level": "loud"})").string()));
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("DURAK_METADATA_PATH", "/opt/durak/metadata.json", 1);
    setenv("DURAK_DEFAULT_RESOURCE", "domains/social_media", 1);
    setenv("DURAK_LOG_LEVEL", "warn", 1);

    auto& config = getConfig();
    EXPECT_TRUE(config.loadFromEnvironment());
    EXPECT_EQ(config.metadataPath, std::filesystem::path("/opt/durak/metadata.json"));
    EXPECT_EQ(config.defaultResource, "domains/social_media");
    EXPECT_EQ(config.logLevel, "warn");
}

TEST_F(ConfigTest, EmptyEnvironmentChangesNothing) {
    auto& config = getConfig();
    EXPECT_FALSE(config.loadFromEnvironment());
    EXPECT_EQ(config.defaultResource, "base/turkish");
}

TEST_F(ConfigTest, ToJsonMirrorsFields) {
    auto j = getConfig().toJson();
    EXPECT_EQ(j["default_resource"].get<std::string>(), "base/turkish");
    EXPECT_EQ(j["log_level"].get<std::string>(), "info");
    EXPECT_EQ(j["metadata_path"].get<std::string>(), Config::defaultMetadataPath().string());
}
