#pragma once

#include <string>
#include <filesystem>

namespace retrohost {

// Directory layout handed to cores and used by the frontend
//
//   <base>/system/          BIOS and firmware (GET_SYSTEM_DIRECTORY)
//   <base>/system/<core>/   per-core assets (GET_CORE_ASSETS_DIRECTORY)
//   <base>/saves/           battery saves (GET_SAVE_DIRECTORY)
//   <base>/screenshots/
//   <base>/config/paths.json
//
// Configured directories may be absolute or relative to the base directory.
class PathsConfiguration {
public:
    PathsConfiguration();
    ~PathsConfiguration() = default;

    // Set the base directory and reset every directory to its default
    void initialize(const std::filesystem::path& base_directory);

    // Read config/paths.json. A missing file keeps the defaults.
    bool load();

    // Write config/paths.json
    bool save() const;

    std::filesystem::path get_system_directory() const { return resolve(m_system_directory); }
    void set_system_directory(const std::filesystem::path& path);

    std::filesystem::path get_save_directory() const { return resolve(m_save_directory); }
    void set_save_directory(const std::filesystem::path& path);

    std::filesystem::path get_screenshot_directory() const { return resolve(m_screenshot_directory); }

    // <system>/<core_name>, with path separators in the name replaced
    std::filesystem::path get_core_assets_directory(const std::string& core_name) const;

    std::filesystem::path get_config_directory() const { return m_base_directory / CONFIG_DIR; }

    bool is_modified() const { return m_modified; }

    // Create a directory (and parents) if absent
    // Returns false if it does not exist afterwards.
    static bool ensure_directory(const std::filesystem::path& path);

    // Create system, saves, screenshots and config directories
    bool ensure_directories_exist() const;

private:
    static constexpr const char* CONFIG_DIR = "config";
    static constexpr const char* CONFIG_FILENAME = "paths.json";

    // JSON key and default for each configurable directory
    struct Entry {
        const char* key;
        const char* default_value;
        std::filesystem::path PathsConfiguration::*member;
    };
    static const Entry ENTRIES[];

    std::filesystem::path resolve(const std::filesystem::path& path) const;
    std::filesystem::path config_file() const { return get_config_directory() / CONFIG_FILENAME; }

    std::filesystem::path m_base_directory;
    std::filesystem::path m_system_directory;
    std::filesystem::path m_save_directory;
    std::filesystem::path m_screenshot_directory;

    bool m_modified = false;
};

} // namespace retrohost
