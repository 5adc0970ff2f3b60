#include <gtest/gtest.h>
#include "TestBundle.hpp"
#include "data/ResourceResolver.hpp"
#include "utils/Logger.hpp"

using namespace Durak;
using DurakTest::TempBundle;

TEST(LoggerTest, MacrosWorkAfterExplicitInitialize) {
    Logger::initialize("debug");
    Logger::initialize("debug");

    LOG_RES_INFO("resource info {}", 1);
    LOG_RES_WARN("resource warn");
    LOG_RES_ERROR("resource error");
    LOG_RES_DEBUG("resource debug");
    LOG_SW_INFO("stopword info");
    LOG_SW_WARN("stopword warn");
    LOG_SW_DEBUG("stopword debug");
    LOG_CLI_INFO("cli info");
    LOG_CLI_ERROR("cli error");

    ASSERT_NE(Logger::getResourceLogger(), nullptr);
    EXPECT_EQ(Logger::getResourceLogger()->name(), "resources");
    EXPECT_EQ(Logger::getStopwordLogger()->name(), "stopwords");
    EXPECT_EQ(Logger::getCliLogger()->name(), "cli");
}

TEST(LoggerTest, ResolvingLogsWithoutBlocking) {
    TempBundle bundle;
    bundle.write("a.txt", "ve\n");
    auto path = bundle.writeMetadata({{"a", {{"file", "a.txt"}}}});

    ResourceResolver resolver;
    auto words = resolver.resolve("a", path);

    ASSERT_NE(words, nullptr);
    EXPECT_EQ(*words, (WordSet{"ve"}));
}
