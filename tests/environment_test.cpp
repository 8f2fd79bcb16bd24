#include "chunkgate/environment.h"

#include "support/ScopedEnvVar.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

using chunkgate::testing::ScopedEnvVar;

class EnvironmentTest : public ::testing::Test {};

}  // namespace

TEST_F(EnvironmentTest, LoadDotEnvPopulatesEnvironment) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / ("chunkgate-test-" + std::to_string(timestamp) + ".env");

    {
        std::ofstream output(path);
        ASSERT_TRUE(output.is_open());
        output << "# comment\n";
        output << "CHUNKGATE_TEST_KEY = test_value\n";
        output << "CHUNKGATE_QUOTED='quoted value'\n";
        output << "   \n";
        output << "not a pair\n";
        output << "CHUNKGATE_EMPTY=\n";
        output << "export CHUNKGATE_EXPORTED=yes # trailing comment\n";
    }

    ScopedEnvVar testKeyGuard("CHUNKGATE_TEST_KEY");
    ScopedEnvVar quotedGuard("CHUNKGATE_QUOTED");
    ScopedEnvVar emptyGuard("CHUNKGATE_EMPTY");
    ScopedEnvVar exportedGuard("CHUNKGATE_EXPORTED");
    testKeyGuard.clear();
    exportedGuard.clear();
    quotedGuard.clear();
    emptyGuard.clear();

    ASSERT_TRUE(chunkgate::loadDotEnv(path));

    auto testValue = chunkgate::getEnv("CHUNKGATE_TEST_KEY");
    ASSERT_TRUE(testValue.has_value());
    EXPECT_EQ(*testValue, "test_value");

    auto quotedValue = chunkgate::getEnv("CHUNKGATE_QUOTED");
    ASSERT_TRUE(quotedValue.has_value());
    EXPECT_EQ(*quotedValue, "quoted value");

    auto emptyValue = chunkgate::getEnv("CHUNKGATE_EMPTY");
    ASSERT_TRUE(emptyValue.has_value());
    EXPECT_TRUE(emptyValue->empty());

    auto exportedValue = chunkgate::getEnv("CHUNKGATE_EXPORTED");
    ASSERT_TRUE(exportedValue.has_value());
    EXPECT_EQ(*exportedValue, "yes");

    std::filesystem::remove(path);
}

TEST_F(EnvironmentTest, LoadDotEnvReportsMissingFile) {
    EXPECT_FALSE(chunkgate::loadDotEnv("/nonexistent/chunkgate/.env"));
}

TEST_F(EnvironmentTest, GetEnvOrDefaultReturnsFallbackWhenUnset) {
    ScopedEnvVar guard("CHUNKGATE_MISSING_KEY");
    guard.clear();

    EXPECT_EQ(chunkgate::getEnvOrDefault("CHUNKGATE_MISSING_KEY", "default"), "default");

    guard.set("configured");
    EXPECT_EQ(chunkgate::getEnvOrDefault("CHUNKGATE_MISSING_KEY", "default"), "configured");
}

TEST_F(EnvironmentTest, GetEnvFlagParsesCommonValues) {
    ScopedEnvVar guard("CHUNKGATE_FLAG_KEY");

    guard.set("true");
    EXPECT_TRUE(chunkgate::getEnvFlag("CHUNKGATE_FLAG_KEY", false));

    guard.set("off");
    EXPECT_FALSE(chunkgate::getEnvFlag("CHUNKGATE_FLAG_KEY", true));

    guard.set("unexpected");
    EXPECT_TRUE(chunkgate::getEnvFlag("CHUNKGATE_FLAG_KEY", true));

    guard.clear();
    EXPECT_FALSE(chunkgate::getEnvFlag("CHUNKGATE_FLAG_KEY", false));
}

TEST_F(EnvironmentTest, GetEnvUnsignedFallsBackOnGarbage) {
    ScopedEnvVar guard("CHUNKGATE_SIZE_KEY");

    guard.set("4096");
    EXPECT_EQ(chunkgate::getEnvUnsigned("CHUNKGATE_SIZE_KEY", 1), 4096U);

    guard.set("lots");
    EXPECT_EQ(chunkgate::getEnvUnsigned("CHUNKGATE_SIZE_KEY", 7), 7U);

    guard.clear();
    EXPECT_EQ(chunkgate::getEnvUnsigned("CHUNKGATE_SIZE_KEY", 9), 9U);
}
