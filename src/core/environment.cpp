#include "environment.hpp"
#include "paths_config.hpp"
#include "core_options.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <vector>

namespace retrohost {

namespace {

void RETRO_CALLCONV log_to_stderr(enum retro_log_level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string message = format_log_message(fmt, args);
    va_end(args);

    if (message.empty()) return;
    std::cerr << "[" << core_log_level_to_string(static_cast<CoreLogLevel>(level)) << "] "
              << message << std::endl;
}

HardwareRenderApi to_render_api(enum retro_hw_context_type type) {
    switch (type) {
        case RETRO_HW_CONTEXT_NONE:             return HardwareRenderApi::None;
        case RETRO_HW_CONTEXT_OPENGL:           return HardwareRenderApi::OpenGL;
        case RETRO_HW_CONTEXT_OPENGL_CORE:      return HardwareRenderApi::OpenGLCore;
        case RETRO_HW_CONTEXT_OPENGLES2:        return HardwareRenderApi::OpenGLES2;
        case RETRO_HW_CONTEXT_OPENGLES3:        return HardwareRenderApi::OpenGLES3;
        case RETRO_HW_CONTEXT_OPENGLES_VERSION: return HardwareRenderApi::OpenGLESVersion;
        case RETRO_HW_CONTEXT_VULKAN:           return HardwareRenderApi::Vulkan;
        default:                                return HardwareRenderApi::Other;
    }
}

} // namespace

std::string format_log_message(const char* fmt, va_list args) {
    if (!fmt) return "";

    char buffer[512];
    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(buffer, sizeof(buffer), fmt, copy);
    va_end(copy);

    if (needed < 0) return "";

    std::string message;
    if (static_cast<size_t>(needed) < sizeof(buffer)) {
        message.assign(buffer, static_cast<size_t>(needed));
    } else {
        // Long message: format again into a buffer capped at MAX_LOG_MESSAGE
        size_t size = std::min(static_cast<size_t>(needed) + 1, EnvironmentNegotiator::MAX_LOG_MESSAGE);
        std::vector<char> large(size);
        va_copy(copy, args);
        std::vsnprintf(large.data(), large.size(), fmt, copy);
        va_end(copy);
        message.assign(large.data());
    }

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

const EnvironmentNegotiator::CommandEntry EnvironmentNegotiator::COMMANDS[] = {
    {RETRO_ENVIRONMENT_GET_CAN_DUPE,              "GET_CAN_DUPE",              true,  &EnvironmentNegotiator::get_can_dupe},
    {RETRO_ENVIRONMENT_SET_MESSAGE,               "SET_MESSAGE",               true,  &EnvironmentNegotiator::set_message},
    {RETRO_ENVIRONMENT_SHUTDOWN,                  "SHUTDOWN",                  false, &EnvironmentNegotiator::shutdown},
    {RETRO_ENVIRONMENT_GET_SYSTEM_DIRECTORY,      "GET_SYSTEM_DIRECTORY",      true,  &EnvironmentNegotiator::get_system_directory},
    {RETRO_ENVIRONMENT_SET_PIXEL_FORMAT,          "SET_PIXEL_FORMAT",          true,  &EnvironmentNegotiator::set_pixel_format},
    {RETRO_ENVIRONMENT_SET_HW_RENDER,             "SET_HW_RENDER",             true,  &EnvironmentNegotiator::set_hw_render},
    {RETRO_ENVIRONMENT_GET_VARIABLE,              "GET_VARIABLE",              true,  &EnvironmentNegotiator::get_variable},
    {RETRO_ENVIRONMENT_SET_VARIABLES,             "SET_VARIABLES",             true,  &EnvironmentNegotiator::set_variables},
    {RETRO_ENVIRONMENT_GET_VARIABLE_UPDATE,       "GET_VARIABLE_UPDATE",       true,  &EnvironmentNegotiator::get_variable_update},
    {RETRO_ENVIRONMENT_GET_LOG_INTERFACE,         "GET_LOG_INTERFACE",         true,  &EnvironmentNegotiator::get_log_interface},
    {RETRO_ENVIRONMENT_GET_CORE_ASSETS_DIRECTORY, "GET_CORE_ASSETS_DIRECTORY", true,  &EnvironmentNegotiator::get_core_assets_directory},
    {RETRO_ENVIRONMENT_GET_SAVE_DIRECTORY,        "GET_SAVE_DIRECTORY",        true,  &EnvironmentNegotiator::get_save_directory},
    {RETRO_ENVIRONMENT_GET_LANGUAGE,              "GET_LANGUAGE",              true,  &EnvironmentNegotiator::get_language},
};

EnvironmentNegotiator::EnvironmentNegotiator(PathsConfiguration& paths, CoreOptions& options)
    : m_paths(paths)
    , m_options(options)
    , m_log_function(log_to_stderr) {
}

const EnvironmentNegotiator::CommandEntry* EnvironmentNegotiator::find_command(unsigned cmd) {
    for (const auto& entry : COMMANDS) {
        if (entry.cmd == cmd) {
            return &entry;
        }
    }
    return nullptr;
}

const char* EnvironmentNegotiator::command_name(unsigned cmd) {
    const CommandEntry* entry = find_command(cmd);
    return entry ? entry->name : "UNKNOWN";
}

void EnvironmentNegotiator::set_log_function(retro_log_printf_t log_function) {
    m_log_function = log_function ? log_function : log_to_stderr;
}

void EnvironmentNegotiator::set_hardware_trampolines(retro_hw_get_current_framebuffer_t get_current_framebuffer,
                                                     retro_hw_get_proc_address_t get_proc_address) {
    m_get_current_framebuffer = get_current_framebuffer;
    m_get_proc_address = get_proc_address;
}

void EnvironmentNegotiator::reset() {
    m_pixel_format = PixelFormat::XRGB8888;
    m_hardware_render = false;
    m_hw_render = retro_hw_render_callback{};
    m_hw_request = HardwareRenderRequest{};
    m_shutdown_requested = false;
    m_variable_values.clear();
    m_reported_unknown.clear();
    m_malformed_count = 0;
    m_declined_count = 0;
}

bool EnvironmentNegotiator::handle(unsigned cmd, void* data) {
    const CommandEntry* entry = find_command(cmd);
    if (!entry) {
        m_declined_count++;
        if (m_reported_unknown.insert(cmd).second) {
            std::cout << "[Environment] Unsupported command " << cmd << ", declining" << std::endl;
        }
        return false;
    }

    if (entry->needs_payload && !data) {
        report_malformed(std::string(entry->name) + " called with a null payload");
        m_declined_count++;
        return false;
    }

    try {
        bool accepted = (this->*(entry->handler))(data);
        if (!accepted) {
            m_declined_count++;
        }
        return accepted;
    }
    catch (const std::exception& e) {
        std::cerr << "[Environment] " << entry->name << " failed: " << e.what() << std::endl;
        m_declined_count++;
        return false;
    }
}

void EnvironmentNegotiator::report_malformed(const std::string& message) {
    m_malformed_count++;
    std::cerr << "[Environment] Malformed callback: " << message << std::endl;
    if (m_malformed_handler) {
        m_malformed_handler(message);
    }
}

bool EnvironmentNegotiator::get_log_interface(void* data) {
    auto* callback = static_cast<retro_log_callback*>(data);
    callback->log = m_log_function;
    return true;
}

bool EnvironmentNegotiator::provide_directory(const std::filesystem::path& path, std::string& storage,
                                              void* data, const char* what) {
    if (!PathsConfiguration::ensure_directory(path)) {
        std::cerr << "[Environment] Could not create " << what << " directory: " << path << std::endl;
        return false;
    }

    // Keep the previous buffer when the value is unchanged so earlier pointers stay valid
    std::string value = path.string();
    if (storage != value) {
        storage = value;
        std::cout << "[Environment] " << what << " directory: " << storage << std::endl;
    }

    *static_cast<const char**>(data) = storage.c_str();
    return true;
}

bool EnvironmentNegotiator::get_system_directory(void* data) {
    return provide_directory(m_paths.get_system_directory(), m_system_directory, data, "System");
}

bool EnvironmentNegotiator::get_save_directory(void* data) {
    return provide_directory(m_paths.get_save_directory(), m_save_directory, data, "Save");
}

bool EnvironmentNegotiator::get_core_assets_directory(void* data) {
    return provide_directory(m_paths.get_core_assets_directory(m_core_name),
                             m_core_assets_directory, data, "Core assets");
}

bool EnvironmentNegotiator::get_language(void* data) {
    *static_cast<unsigned*>(data) = RETRO_LANGUAGE_ENGLISH;
    return true;
}

bool EnvironmentNegotiator::get_variable(void* data) {
    auto* variable = static_cast<retro_variable*>(data);
    if (!variable->key) {
        report_malformed("GET_VARIABLE called with a null key");
        return false;
    }

    std::string key = variable->key;
    auto value = m_options.get_value(key);
    if (!value) {
        variable->value = nullptr;
        return false;
    }

    std::string& storage = m_variable_values[key];
    storage = *value;
    variable->value = storage.c_str();
    return true;
}

bool EnvironmentNegotiator::set_variables(void* data) {
    const auto* variables = static_cast<const retro_variable*>(data);
    int declared = 0;
    for (const retro_variable* variable = variables; variable->key; ++variable) {
        if (m_options.declare_variable(variable->key, variable->value ? variable->value : "")) {
            declared++;
        }
    }
    std::cout << "[Environment] Core declared " << declared << " variable(s)" << std::endl;
    return true;
}

bool EnvironmentNegotiator::get_variable_update(void* data) {
    *static_cast<bool*>(data) = m_options.consume_update();
    return true;
}

bool EnvironmentNegotiator::set_pixel_format(void* data) {
    auto requested = *static_cast<const enum retro_pixel_format*>(data);
    auto format = static_cast<PixelFormat>(static_cast<uint32_t>(requested));

    if (requested != RETRO_PIXEL_FORMAT_XRGB8888) {
        std::cout << "[Environment] Declining pixel format " << pixel_format_to_string(format)
                  << ", keeping " << pixel_format_to_string(m_pixel_format) << std::endl;
        return false;
    }

    m_pixel_format = PixelFormat::XRGB8888;
    std::cout << "[Environment] Pixel format: " << pixel_format_to_string(m_pixel_format) << std::endl;
    return true;
}

bool EnvironmentNegotiator::set_hw_render(void* data) {
    auto* callback = static_cast<retro_hw_render_callback*>(data);

    if (!m_render_host) {
        std::cout << "[Environment] No render host, declining hardware rendering" << std::endl;
        return false;
    }
    if (!m_get_current_framebuffer || !m_get_proc_address) {
        std::cerr << "[Environment] Hardware trampolines not set, declining hardware rendering" << std::endl;
        return false;
    }

    HardwareRenderRequest request;
    request.api = to_render_api(callback->context_type);
    request.version_major = callback->version_major;
    request.version_minor = callback->version_minor;
    request.depth = callback->depth;
    request.stencil = callback->stencil;
    request.bottom_left_origin = callback->bottom_left_origin;
    request.debug_context = callback->debug_context;

    if (m_hardware_render) {
        m_render_host->destroy_context();
        m_hardware_render = false;
    }

    if (!m_render_host->create_context(request)) {
        std::cerr << "[Environment] Render host rejected " << hardware_render_api_to_string(request.api)
                  << " " << request.version_major << "." << request.version_minor << std::endl;
        return false;
    }

    callback->get_current_framebuffer = m_get_current_framebuffer;
    callback->get_proc_address = m_get_proc_address;

    m_hw_render = *callback;
    m_hw_request = request;
    m_hardware_render = true;

    std::cout << "[Environment] Hardware rendering: " << hardware_render_api_to_string(request.api)
              << " " << request.version_major << "." << request.version_minor << std::endl;
    return true;
}

bool EnvironmentNegotiator::get_can_dupe(void* data) {
    *static_cast<bool*>(data) = true;
    return true;
}

bool EnvironmentNegotiator::set_message(void* data) {
    const auto* message = static_cast<const retro_message*>(data);
    if (!message->msg) {
        report_malformed("SET_MESSAGE called with a null message");
        return false;
    }
    std::cout << "[Core message] " << message->msg << std::endl;
    return true;
}

bool EnvironmentNegotiator::shutdown(void* /*data*/) {
    std::cout << "[Environment] Core requested shutdown" << std::endl;
    m_shutdown_requested = true;
    return true;
}

} // namespace retrohost
