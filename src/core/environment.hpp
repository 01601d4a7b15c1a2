#pragma once

#include "retrohost/core_types.hpp"
#include "retrohost/render_host.hpp"
#include <libretro.h>
#include <cstdarg>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace retrohost {

class PathsConfiguration;
class CoreOptions;

// Format a printf-style core log message
// A null format yields an empty string. Trailing newlines are removed.
std::string format_log_message(const char* fmt, va_list args);

// Answers the core's environment callback
//
// Every known command is listed in a closed table mapping the command code
// to a handler. Unknown commands are declined. A known command that needs a
// payload but receives null is a malformed callback: it is logged, counted
// and declined without touching the pointer.
class EnvironmentNegotiator {
public:
    static constexpr size_t MAX_LOG_MESSAGE = 4096;

    using MalformedHandler = std::function<void(const std::string& message)>;

    EnvironmentNegotiator(PathsConfiguration& paths, CoreOptions& options);
    ~EnvironmentNegotiator() = default;

    // Disable copy
    EnvironmentNegotiator(const EnvironmentNegotiator&) = delete;
    EnvironmentNegotiator& operator=(const EnvironmentNegotiator&) = delete;

    // Entry point for retro_environment_t. Never throws.
    bool handle(unsigned cmd, void* data);

    // Forget per-core negotiation results (pixel format, hardware render, shutdown)
    void reset();

    // Core name used for the core assets directory
    void set_core_name(const std::string& name) { m_core_name = name; }
    const std::string& get_core_name() const { return m_core_name; }

    // Function handed out through GET_LOG_INTERFACE
    // Defaults to a function that writes to std::cerr.
    void set_log_function(retro_log_printf_t log_function);

    // Hardware rendering is only offered when a render host is attached
    void set_render_host(IRenderHost* render_host) { m_render_host = render_host; }
    IRenderHost* get_render_host() const { return m_render_host; }

    // Context-free functions written into retro_hw_render_callback
    void set_hardware_trampolines(retro_hw_get_current_framebuffer_t get_current_framebuffer,
                                  retro_hw_get_proc_address_t get_proc_address);

    void set_malformed_handler(MalformedHandler handler) { m_malformed_handler = std::move(handler); }

    // Negotiated state
    PixelFormat get_pixel_format() const { return m_pixel_format; }
    bool is_hardware_render() const { return m_hardware_render; }
    const retro_hw_render_callback& get_hw_render_callback() const { return m_hw_render; }
    const HardwareRenderRequest& get_hw_render_request() const { return m_hw_request; }
    bool is_shutdown_requested() const { return m_shutdown_requested; }

    uint64_t get_malformed_count() const { return m_malformed_count; }
    uint64_t get_declined_count() const { return m_declined_count; }

    // Human-readable name of a command code ("UNKNOWN" if not in the table)
    static const char* command_name(unsigned cmd);

private:
    using Handler = bool (EnvironmentNegotiator::*)(void* data);

    struct CommandEntry {
        unsigned cmd;
        const char* name;
        bool needs_payload;
        Handler handler;
    };

    static const CommandEntry COMMANDS[];
    static const CommandEntry* find_command(unsigned cmd);

    bool get_log_interface(void* data);
    bool get_system_directory(void* data);
    bool get_save_directory(void* data);
    bool get_core_assets_directory(void* data);
    bool get_language(void* data);
    bool get_variable(void* data);
    bool set_variables(void* data);
    bool get_variable_update(void* data);
    bool set_pixel_format(void* data);
    bool set_hw_render(void* data);
    bool get_can_dupe(void* data);
    bool set_message(void* data);
    bool shutdown(void* data);

    // Create the directory, keep its string alive, and hand it to the core
    bool provide_directory(const std::filesystem::path& path, std::string& storage,
                           void* data, const char* what);

    void report_malformed(const std::string& message);

    PathsConfiguration& m_paths;
    CoreOptions& m_options;
    IRenderHost* m_render_host = nullptr;
    MalformedHandler m_malformed_handler;

    std::string m_core_name;
    retro_log_printf_t m_log_function = nullptr;
    retro_hw_get_current_framebuffer_t m_get_current_framebuffer = nullptr;
    retro_hw_get_proc_address_t m_get_proc_address = nullptr;

    // Strings returned to the core; must outlive the core's use of them
    std::string m_system_directory;
    std::string m_save_directory;
    std::string m_core_assets_directory;
    std::unordered_map<std::string, std::string> m_variable_values;

    PixelFormat m_pixel_format = PixelFormat::XRGB8888;
    bool m_hardware_render = false;
    retro_hw_render_callback m_hw_render{};
    HardwareRenderRequest m_hw_request;
    bool m_shutdown_requested = false;

    std::unordered_set<unsigned> m_reported_unknown;
    uint64_t m_malformed_count = 0;
    uint64_t m_declined_count = 0;
};

} // namespace retrohost
