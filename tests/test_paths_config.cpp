#include "core/paths_config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace retrohost {
namespace {

using test::TempDirectory;
namespace fs = std::filesystem;

TEST(PathsConfigTest, DefaultsResolveAgainstBaseDirectory) {
    TempDirectory temp;
    PathsConfiguration paths;
    paths.initialize(temp.path());

    EXPECT_EQ(paths.get_system_directory(), temp.path() / "system");
    EXPECT_EQ(paths.get_save_directory(), temp.path() / "saves");
    EXPECT_EQ(paths.get_screenshot_directory(), temp.path() / "screenshots");
    EXPECT_EQ(paths.get_config_directory(), temp.path() / "config");
}

TEST(PathsConfigTest, CoreAssetsDirectorySanitizesName) {
    TempDirectory temp;
    PathsConfiguration paths;
    paths.initialize(temp.path());

    EXPECT_EQ(paths.get_core_assets_directory("PPSSPP"), temp.path() / "system" / "PPSSPP");
    EXPECT_EQ(paths.get_core_assets_directory("a/b\\c:d"), temp.path() / "system" / "a_b_c_d");
    EXPECT_EQ(paths.get_core_assets_directory(""), temp.path() / "system" / "core");
}

TEST(PathsConfigTest, AbsolutePathsAreKept) {
    TempDirectory base;
    TempDirectory elsewhere;
    PathsConfiguration paths;
    paths.initialize(base.path());

    paths.set_save_directory(elsewhere.path());
    EXPECT_EQ(paths.get_save_directory(), elsewhere.path());
    EXPECT_TRUE(paths.is_modified());
}

TEST(PathsConfigTest, EnsureDirectoriesCreatesLayout) {
    TempDirectory temp;
    PathsConfiguration paths;
    paths.initialize(temp.path());

    EXPECT_TRUE(paths.ensure_directories_exist());
    EXPECT_TRUE(fs::is_directory(temp.path() / "system"));
    EXPECT_TRUE(fs::is_directory(temp.path() / "saves"));
    EXPECT_TRUE(fs::is_directory(temp.path() / "screenshots"));
    EXPECT_TRUE(fs::is_directory(temp.path() / "config"));
}

TEST(PathsConfigTest, EnsureDirectoryFailsWhenFileIsInTheWay) {
    TempDirectory temp;
    fs::path blocker = temp.write_file("blocker", "not a directory");
    EXPECT_FALSE(PathsConfiguration::ensure_directory(blocker));
    EXPECT_FALSE(PathsConfiguration::ensure_directory(blocker / "child"));
}

TEST(PathsConfigTest, SaveAndLoadRoundTrip) {
    TempDirectory temp;
    {
        PathsConfiguration paths;
        paths.initialize(temp.path());
        paths.set_system_directory("bios");
        paths.set_save_directory("memcards");
        ASSERT_TRUE(paths.save());
    }

    nlohmann::json json;
    std::ifstream file(temp.path() / "config" / "paths.json");
    file >> json;
    EXPECT_EQ(json["system_directory"], "bios");

    PathsConfiguration loaded;
    loaded.initialize(temp.path());
    ASSERT_TRUE(loaded.load());
    EXPECT_EQ(loaded.get_system_directory(), temp.path() / "bios");
    EXPECT_EQ(loaded.get_save_directory(), temp.path() / "memcards");
    EXPECT_EQ(loaded.get_screenshot_directory(), temp.path() / "screenshots");
    EXPECT_FALSE(loaded.is_modified());
}

TEST(PathsConfigTest, MissingConfigKeepsDefaults) {
    TempDirectory temp;
    PathsConfiguration paths;
    paths.initialize(temp.path());
    EXPECT_TRUE(paths.load());
    EXPECT_EQ(paths.get_system_directory(), temp.path() / "system");
}

TEST(PathsConfigTest, CorruptConfigIsRejected) {
    TempDirectory temp;
    fs::create_directories(temp.path() / "config");
    temp.write_file("config/paths.json", "{ not json");

    PathsConfiguration paths;
    paths.initialize(temp.path());
    EXPECT_FALSE(paths.load());
    EXPECT_EQ(paths.get_system_directory(), temp.path() / "system");
}

} // namespace
} // namespace retrohost
