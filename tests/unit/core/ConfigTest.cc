#include "fleet/core/Config.hh"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace fleet;

TEST(ConfigTest, EmptyDocumentUsesDefaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.isOk());
    EXPECT_FALSE(config.value().registryPath.has_value());
    EXPECT_EQ(config.value().dispatch, DispatchPolicy{});
    EXPECT_EQ(config.value().logLevel, "info");
}

TEST(ConfigTest, ReadsEverySection) {
    auto config = Config::parse(R"(
        [registry]
        path = "/etc/fleet/registry.toml"

        [dispatch]
        stop_on_first_failure = true
        max_handlers = 0

        [log]
        level = "debug"
    )");
    ASSERT_TRUE(config.isOk()) << config.message();

    EXPECT_EQ(config.value().registryPath, std::filesystem::path("/etc/fleet/registry.toml"));
    EXPECT_TRUE(config.value().dispatch.stopOnFirstFailure);
    EXPECT_EQ(config.value().dispatch.maxHandlers, 0u);
    EXPECT_EQ(config.value().logLevel, "debug");
}

TEST(ConfigTest, WrongTypesAreErrors) {
    EXPECT_EQ(Config::parse("[dispatch]\nmax_handlers = \"many\"").code(), ErrorCode::InvalidState);
    EXPECT_EQ(Config::parse("[dispatch]\nstop_on_first_failure = 1").code(), ErrorCode::InvalidState);
    EXPECT_EQ(Config::parse("[registry]\npath = 3").code(), ErrorCode::InvalidState);
}

TEST(ConfigTest, NegativeBoundIsRejected) {
    auto config = Config::parse("[dispatch]\nmax_handlers = -1");
    ASSERT_TRUE(config.isError());
    EXPECT_EQ(config.code(), ErrorCode::InvalidArgument);
}

TEST(ConfigTest, UnknownLogLevelIsRejected) {
    auto config = Config::parse("[log]\nlevel = \"loud\"");
    ASSERT_TRUE(config.isError());
    EXPECT_EQ(config.code(), ErrorCode::InvalidArgument);
}

TEST(ConfigTest, MalformedTomlIsParseError) {
    EXPECT_EQ(Config::parse("[dispatch").code(), ErrorCode::ParseError);
}

TEST(ConfigTest, LoadResolvesRegistryPathAgainstConfigDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "fleet_config_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream ofs(dir / "fleet.toml");
        ofs << "[registry]\npath = \"registry.toml\"\n";
    }

    auto config = Config::load(dir / "fleet.toml");
    ASSERT_TRUE(config.isOk()) << config.message();
    EXPECT_EQ(config.value().registryPath, dir / "registry.toml");

    std::filesystem::remove_all(dir);
}

TEST(ConfigTest, LoadMissingFile) {
    EXPECT_EQ(Config::load("/nonexistent/fleet.toml").code(), ErrorCode::NotFound);
}
