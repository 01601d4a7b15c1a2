#include "core/core_loader.hpp"

#include <gtest/gtest.h>
#include <cstring>

namespace retrohost {
namespace {

TEST(CoreLoaderTest, RequiredSymbolsAreListedInResolutionOrder) {
    ASSERT_EQ(CoreLoader::REQUIRED_SYMBOLS.size(), 11u);
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[0], "retro_init");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[1], "retro_deinit");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[2], "retro_run");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[3], "retro_load_game");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[4], "retro_get_system_av_info");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[5], "retro_set_environment");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[6], "retro_set_video_refresh");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[7], "retro_set_audio_sample");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[8], "retro_set_audio_sample_batch");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[9], "retro_set_input_poll");
    EXPECT_STREQ(CoreLoader::REQUIRED_SYMBOLS[10], "retro_set_input_state");
}

TEST(CoreLoaderTest, OpensAndResolvesCompleteCore) {
    CoreLoader loader;
    ASSERT_TRUE(loader.open(MOCK_CORE_PATH));
    EXPECT_TRUE(loader.is_open());

    CoreEntryPoints entry;
    ASSERT_TRUE(loader.resolve(entry));
    EXPECT_TRUE(entry.is_complete());
    EXPECT_FALSE(loader.get_last_error().is_error());

    // Optional entry points the mock exports
    EXPECT_NE(entry.retro_api_version, nullptr);
    EXPECT_NE(entry.retro_get_system_info, nullptr);
    EXPECT_NE(entry.retro_unload_game, nullptr);
    EXPECT_NE(entry.retro_reset, nullptr);
    EXPECT_EQ(entry.retro_api_version(), static_cast<unsigned>(RETRO_API_VERSION));
}

TEST(CoreLoaderTest, MissingSymbolNamesFirstAbsentInOrder) {
    CoreLoader loader;
    ASSERT_TRUE(loader.open(MOCK_CORE_MISSING_PATH));

    CoreEntryPoints entry;
    EXPECT_FALSE(loader.resolve(entry));

    const CoreError& error = loader.get_last_error();
    EXPECT_EQ(error.kind, CoreErrorKind::SymbolMissing);
    // retro_set_input_state is missing too but comes later
    EXPECT_EQ(error.symbol, "retro_set_audio_sample_batch");
    EXPECT_NE(error.message.find("retro_set_audio_sample_batch"), std::string::npos);

    // A partial resolution is not handed out
    EXPECT_EQ(entry.retro_init, nullptr);
    EXPECT_EQ(entry.retro_set_audio_sample, nullptr);
    EXPECT_FALSE(entry.is_complete());
}

TEST(CoreLoaderTest, NonexistentLibraryIsLoadFailure) {
    CoreLoader loader;
    EXPECT_FALSE(loader.open("/nonexistent/path/to/core_libretro.so"));
    EXPECT_FALSE(loader.is_open());
    EXPECT_EQ(loader.get_last_error().kind, CoreErrorKind::LoadFailure);
    EXPECT_FALSE(loader.get_last_error().message.empty());
}

TEST(CoreLoaderTest, ResolveWithoutOpenLibraryFails) {
    CoreLoader loader;
    CoreEntryPoints entry;
    EXPECT_FALSE(loader.resolve(entry));
    EXPECT_EQ(loader.get_last_error().kind, CoreErrorKind::LoadFailure);
}

TEST(CoreLoaderTest, CloseIsSafeWhenNothingIsOpen) {
    CoreLoader loader;
    loader.close();
    EXPECT_FALSE(loader.is_open());

    ASSERT_TRUE(loader.open(MOCK_CORE_PATH));
    loader.close();
    loader.close();
    EXPECT_FALSE(loader.is_open());
    EXPECT_EQ(loader.get_symbol("retro_init"), nullptr);
}

TEST(CoreLoaderTest, LibraryExtensionMatchesPlatform) {
    const char* extension = CoreLoader::get_library_extension();
    ASSERT_NE(extension, nullptr);
    EXPECT_EQ(extension[0], '.');
#if defined(__linux__)
    EXPECT_STREQ(extension, ".so");
#endif
}

} // namespace
} // namespace retrohost
