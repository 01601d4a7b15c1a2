#include "core/core_options.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace retrohost {
namespace {

using test::TempDirectory;

TEST(CoreOptionsTest, DeclarationParsesDescriptionAndChoices) {
    CoreOptions options;
    ASSERT_TRUE(options.declare_variable("ppsspp_cpu_core", "CPU core;  JIT | IR JIT|Interpreter "));

    const CoreOptions::Variable* variable = options.get_declared_variable("ppsspp_cpu_core");
    ASSERT_NE(variable, nullptr);
    EXPECT_EQ(variable->description, "CPU core");
    ASSERT_EQ(variable->choices.size(), 3u);
    EXPECT_EQ(variable->choices[0], "JIT");
    EXPECT_EQ(variable->choices[1], "IR JIT");
    EXPECT_EQ(variable->choices[2], "Interpreter");
}

TEST(CoreOptionsTest, DeclarationWithoutChoicesIsRejected) {
    CoreOptions options;
    EXPECT_FALSE(options.declare_variable("a", "No separator"));
    EXPECT_FALSE(options.declare_variable("b", "Empty; | "));
    EXPECT_FALSE(options.declare_variable("", "Desc; x"));
    EXPECT_TRUE(options.get_declared_keys().empty());
}

TEST(CoreOptionsTest, DeclaredKeysKeepDeclarationOrder) {
    CoreOptions options;
    options.declare_variable("zeta", "Z; 1|2");
    options.declare_variable("alpha", "A; 1|2");
    options.declare_variable("zeta", "Z again; 3");

    std::vector<std::string> keys = options.get_declared_keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "zeta");
    EXPECT_EQ(keys[1], "alpha");
    EXPECT_EQ(options.get_value("zeta"), "3");

    options.clear_declared_variables();
    EXPECT_TRUE(options.get_declared_keys().empty());
    EXPECT_FALSE(options.get_value("zeta").has_value());
}

TEST(CoreOptionsTest, LookupPriority) {
    CoreOptions options;
    options.set_active_core("PPSSPP");
    options.declare_variable("ppsspp_backend", "Backend; vulkan|opengl");

    // Declared default beats the built-in
    EXPECT_EQ(options.get_value("ppsspp_backend"), "vulkan");

    options.set_global_option("ppsspp_backend", "opengl");
    EXPECT_EQ(options.get_value("ppsspp_backend"), "opengl");

    options.set_core_option("PPSSPP", "ppsspp_backend", "GLES3");
    EXPECT_EQ(options.get_value("ppsspp_backend"), "GLES3");

    // Overrides for another core do not apply
    options.set_core_option("Other", "ppsspp_backend", "d3d11");
    EXPECT_EQ(options.get_value("ppsspp_backend"), "GLES3");

    options.clear_core_option("PPSSPP", "ppsspp_backend");
    EXPECT_EQ(options.get_value("ppsspp_backend"), "opengl");
}

TEST(CoreOptionsTest, BuiltinDefaultsAnswerUndeclaredKeys) {
    CoreOptions options;
    EXPECT_EQ(options.get_value("ppsspp_backend"), "GLES3");
    EXPECT_EQ(options.get_value("ppsspp_rendering_mode"), "hardware");
    EXPECT_FALSE(options.get_value("unknown_key").has_value());
    EXPECT_EQ(CoreOptions::get_builtin_default("unknown_key"), nullptr);
}

TEST(CoreOptionsTest, UpdateFlagIsConsumedOnce) {
    CoreOptions options;
    EXPECT_FALSE(options.consume_update());

    options.set_global_option("key", "value");
    EXPECT_TRUE(options.consume_update());
    EXPECT_FALSE(options.consume_update());
    EXPECT_TRUE(options.is_modified());

    // Clearing an override that does not exist changes nothing
    options.clear_core_option("Nobody", "key");
    EXPECT_FALSE(options.consume_update());
}

TEST(CoreOptionsTest, SaveAndLoadOverrides) {
    TempDirectory temp;
    auto path = temp.path() / "config" / "core_options.json";
    {
        CoreOptions options;
        options.set_global_option("shared", "yes");
        options.set_core_option("MockCore", "mock_option", "beta");
        ASSERT_TRUE(options.save(path));
    }

    nlohmann::json json;
    std::ifstream file(path);
    file >> json;
    EXPECT_EQ(json["global_options"]["shared"], "yes");
    EXPECT_EQ(json["core_options"]["MockCore"]["mock_option"], "beta");

    CoreOptions loaded;
    ASSERT_TRUE(loaded.load(path));
    loaded.set_active_core("MockCore");
    EXPECT_EQ(loaded.get_value("shared"), "yes");
    EXPECT_EQ(loaded.get_value("mock_option"), "beta");
    EXPECT_FALSE(loaded.is_modified());
}

TEST(CoreOptionsTest, MissingFileIsNotAnError) {
    TempDirectory temp;
    CoreOptions options;
    EXPECT_TRUE(options.load(temp.path() / "absent.json"));
}

TEST(CoreOptionsTest, CorruptFileIsRejected) {
    TempDirectory temp;
    auto path = temp.write_file("core_options.json", "[1, 2");
    CoreOptions options;
    EXPECT_FALSE(options.load(path));
}

} // namespace
} // namespace retrohost
