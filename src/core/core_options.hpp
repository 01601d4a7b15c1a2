#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <filesystem>

namespace retrohost {

// Configuration variables answered through GET_VARIABLE
//
// Lookup order for a key:
//   1. user override for the active core (core_options.<core>.<key>)
//   2. user override for every core (global_options.<key>)
//   3. default declared by the core through SET_VARIABLES (first choice)
//   4. built-in host default
// A key found nowhere is declined.
// Persisted to config/core_options.json.
class CoreOptions {
public:
    struct Variable {
        std::string description;
        std::vector<std::string> choices;   // choices[0] is the default
    };

    CoreOptions();
    ~CoreOptions() = default;

    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to last loaded path

    // Per-core overrides apply to this core
    void set_active_core(const std::string& core_name);
    const std::string& get_active_core() const { return m_active_core; }

    // Resolve a key following the lookup order above
    std::optional<std::string> get_value(const std::string& key) const;

    // Register a core-declared variable from "Description; a|b|c"
    // Returns false when the definition has no choices.
    bool declare_variable(const std::string& key, const std::string& definition);

    // Forget all core-declared variables (new core loaded)
    void clear_declared_variables();

    const Variable* get_declared_variable(const std::string& key) const;
    std::vector<std::string> get_declared_keys() const;

    // User overrides
    void set_global_option(const std::string& key, const std::string& value);
    void set_core_option(const std::string& core_name, const std::string& key, const std::string& value);
    void clear_core_option(const std::string& core_name, const std::string& key);

    // True once after any override changed (GET_VARIABLE_UPDATE)
    bool consume_update();

    bool is_modified() const { return m_modified; }
    void clear_modified() { m_modified = false; }

    // Built-in value for a key, or nullptr
    static const char* get_builtin_default(const std::string& key);

private:
    std::unordered_map<std::string, std::string> m_global_options;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> m_core_options;
    std::unordered_map<std::string, Variable> m_declared;
    std::vector<std::string> m_declared_order;
    std::string m_active_core;
    std::filesystem::path m_config_path;
    bool m_updated = false;
    bool m_modified = false;
};

} // namespace retrohost
