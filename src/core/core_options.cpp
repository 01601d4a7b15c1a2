#include "core_options.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace retrohost {

namespace {

struct BuiltinOption {
    const char* key;
    const char* value;
};

// Defaults answered even when neither the core nor the user declared the key
const BuiltinOption BUILTIN_OPTIONS[] = {
    {"ppsspp_backend", "GLES3"},
    {"ppsspp_rendering_mode", "hardware"},
};

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

CoreOptions::CoreOptions() = default;

bool CoreOptions::load(const std::filesystem::path& path) {
    m_config_path = path;

    if (!std::filesystem::exists(path)) {
        // No config file yet, use defaults
        return true;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open core options: " << path << std::endl;
            return false;
        }

        nlohmann::json json;
        file >> json;

        if (json.contains("global_options") && json["global_options"].is_object()) {
            for (auto& [key, value] : json["global_options"].items()) {
                if (value.is_string()) {
                    m_global_options[key] = value.get<std::string>();
                }
            }
        }

        if (json.contains("core_options") && json["core_options"].is_object()) {
            for (auto& [core_name, options] : json["core_options"].items()) {
                if (options.is_object()) {
                    for (auto& [key, value] : options.items()) {
                        if (value.is_string()) {
                            m_core_options[core_name][key] = value.get<std::string>();
                        }
                    }
                }
            }
        }

        m_modified = false;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error loading core options: " << e.what() << std::endl;
        return false;
    }
}

bool CoreOptions::save(const std::filesystem::path& path) const {
    try {
        nlohmann::json json;

        // Ensure empty objects, not null
        nlohmann::json global = nlohmann::json::object();
        for (const auto& [key, value] : m_global_options) {
            global[key] = value;
        }
        json["global_options"] = global;

        nlohmann::json cores = nlohmann::json::object();
        for (const auto& [core_name, options] : m_core_options) {
            nlohmann::json core_json = nlohmann::json::object();
            for (const auto& [key, value] : options) {
                core_json[key] = value;
            }
            cores[core_name] = core_json;
        }
        json["core_options"] = cores;

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open core options for writing: " << path << std::endl;
            return false;
        }

        file << json.dump(4);
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error saving core options: " << e.what() << std::endl;
        return false;
    }
}

bool CoreOptions::save() const {
    if (m_config_path.empty()) {
        std::cerr << "No config path set" << std::endl;
        return false;
    }
    return save(m_config_path);
}

void CoreOptions::set_active_core(const std::string& core_name) {
    m_active_core = core_name;
}

std::optional<std::string> CoreOptions::get_value(const std::string& key) const {
    auto core_it = m_core_options.find(m_active_core);
    if (core_it != m_core_options.end()) {
        auto it = core_it->second.find(key);
        if (it != core_it->second.end()) {
            return it->second;
        }
    }

    auto global_it = m_global_options.find(key);
    if (global_it != m_global_options.end()) {
        return global_it->second;
    }

    auto declared_it = m_declared.find(key);
    if (declared_it != m_declared.end() && !declared_it->second.choices.empty()) {
        return declared_it->second.choices.front();
    }

    if (const char* builtin = get_builtin_default(key)) {
        return std::string(builtin);
    }

    return std::nullopt;
}

bool CoreOptions::declare_variable(const std::string& key, const std::string& definition) {
    if (key.empty()) {
        return false;
    }

    // "Description; choice|choice|choice"
    size_t separator = definition.find(';');
    if (separator == std::string::npos) {
        std::cerr << "[Options] Variable " << key << " has no choices: " << definition << std::endl;
        return false;
    }

    Variable variable;
    variable.description = trim(definition.substr(0, separator));

    std::string choices = definition.substr(separator + 1);
    size_t start = 0;
    while (start <= choices.size()) {
        size_t bar = choices.find('|', start);
        std::string choice = trim(choices.substr(start, bar == std::string::npos ? std::string::npos : bar - start));
        if (!choice.empty()) {
            variable.choices.push_back(choice);
        }
        if (bar == std::string::npos) break;
        start = bar + 1;
    }

    if (variable.choices.empty()) {
        std::cerr << "[Options] Variable " << key << " has no choices: " << definition << std::endl;
        return false;
    }

    if (m_declared.find(key) == m_declared.end()) {
        m_declared_order.push_back(key);
    }
    m_declared[key] = std::move(variable);
    return true;
}

void CoreOptions::clear_declared_variables() {
    m_declared.clear();
    m_declared_order.clear();
}

const CoreOptions::Variable* CoreOptions::get_declared_variable(const std::string& key) const {
    auto it = m_declared.find(key);
    return it != m_declared.end() ? &it->second : nullptr;
}

std::vector<std::string> CoreOptions::get_declared_keys() const {
    return m_declared_order;
}

void CoreOptions::set_global_option(const std::string& key, const std::string& value) {
    m_global_options[key] = value;
    m_updated = true;
    m_modified = true;
}

void CoreOptions::set_core_option(const std::string& core_name, const std::string& key, const std::string& value) {
    m_core_options[core_name][key] = value;
    m_updated = true;
    m_modified = true;
}

void CoreOptions::clear_core_option(const std::string& core_name, const std::string& key) {
    auto core_it = m_core_options.find(core_name);
    if (core_it == m_core_options.end()) return;

    if (core_it->second.erase(key) > 0) {
        m_updated = true;
        m_modified = true;
    }
}

bool CoreOptions::consume_update() {
    bool updated = m_updated;
    m_updated = false;
    return updated;
}

const char* CoreOptions::get_builtin_default(const std::string& key) {
    for (const auto& option : BUILTIN_OPTIONS) {
        if (key == option.key) {
            return option.value;
        }
    }
    return nullptr;
}

} // namespace retrohost
