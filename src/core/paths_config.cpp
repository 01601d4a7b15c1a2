#include "paths_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace retrohost {

namespace fs = std::filesystem;

const PathsConfiguration::Entry PathsConfiguration::ENTRIES[] = {
    {"system_directory",     "system",      &PathsConfiguration::m_system_directory},
    {"save_directory",       "saves",       &PathsConfiguration::m_save_directory},
    {"screenshot_directory", "screenshots", &PathsConfiguration::m_screenshot_directory},
};

PathsConfiguration::PathsConfiguration() = default;

void PathsConfiguration::initialize(const fs::path& base_directory) {
    m_base_directory = base_directory;
    for (const Entry& entry : ENTRIES) {
        this->*entry.member = entry.default_value;
    }
    m_modified = false;
}

bool PathsConfiguration::load() {
    fs::path path = config_file();
    if (!fs::exists(path)) {
        std::cout << "[Paths] No " << CONFIG_FILENAME << ", using defaults" << std::endl;
        return true;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[Paths] Failed to open " << path << std::endl;
            return false;
        }

        nlohmann::json json;
        file >> json;

        for (const Entry& entry : ENTRIES) {
            auto it = json.find(entry.key);
            if (it != json.end() && it->is_string()) {
                this->*entry.member = it->get<std::string>();
            }
        }

        m_modified = false;
        std::cout << "[Paths] Loaded " << path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[Paths] Error loading " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool PathsConfiguration::save() const {
    fs::path path = config_file();
    try {
        // Stored as configured, relative paths stay relative
        nlohmann::json json;
        for (const Entry& entry : ENTRIES) {
            json[entry.key] = (this->*entry.member).string();
        }

        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[Paths] Failed to open " << path << " for writing" << std::endl;
            return false;
        }

        file << json.dump(4);
        std::cout << "[Paths] Saved " << path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[Paths] Error saving " << path << ": " << e.what() << std::endl;
        return false;
    }
}

fs::path PathsConfiguration::resolve(const fs::path& path) const {
    return path.is_absolute() ? path : m_base_directory / path;
}

void PathsConfiguration::set_system_directory(const fs::path& path) {
    m_system_directory = path;
    m_modified = true;
}

void PathsConfiguration::set_save_directory(const fs::path& path) {
    m_save_directory = path;
    m_modified = true;
}

fs::path PathsConfiguration::get_core_assets_directory(const std::string& core_name) const {
    std::string safe_name = core_name.empty() ? "core" : core_name;
    for (char& c : safe_name) {
        if (c == '/' || c == '\\' || c == ':') {
            c = '_';
        }
    }
    return get_system_directory() / safe_name;
}

bool PathsConfiguration::ensure_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    std::error_code status_ec;
    if (fs::is_directory(path, status_ec)) {
        return true;
    }
    std::cerr << "[Paths] Could not create " << path;
    if (ec) {
        std::cerr << ": " << ec.message();
    }
    std::cerr << std::endl;
    return false;
}

bool PathsConfiguration::ensure_directories_exist() const {
    bool ok = ensure_directory(get_system_directory());
    ok = ensure_directory(get_save_directory()) && ok;
    ok = ensure_directory(get_screenshot_directory()) && ok;
    ok = ensure_directory(get_config_directory()) && ok;
    return ok;
}

} // namespace retrohost
