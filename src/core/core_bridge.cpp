#include "core_bridge.hpp"
#include "active_bridge.hpp"
#include "paths_config.hpp"
#include "core_options.hpp"
#include "sample_convert.hpp"

#include <cstdarg>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>

namespace retrohost {

namespace fs = std::filesystem;

CoreBridge::CoreBridge(PathsConfiguration& paths, CoreOptions& options)
    : m_options(options)
    , m_environment(paths, options) {
    m_environment.set_log_function(log_callback);
    m_environment.set_hardware_trampolines(hw_get_current_framebuffer, hw_get_proc_address);
    m_environment.set_malformed_handler([this](const std::string& message) {
        report_malformed(message);
    });
}

CoreBridge::~CoreBridge() {
    stop();
    ActiveBridge::release(this);
}

void CoreBridge::set_render_host(IRenderHost* render_host) {
    m_render_host = render_host;
    m_environment.set_render_host(render_host);
}

// =============================================================================
// Lifecycle
// =============================================================================

bool CoreBridge::initialize(const fs::path& core_path) {
    BridgeState state = get_state();
    if (state != BridgeState::Unloaded && state != BridgeState::Stopped) {
        report_error(CoreErrorKind::InitializationFailure,
                     std::string("Cannot initialize a core while ") + bridge_state_to_string(state));
        return false;
    }

    m_last_error = {};

    // Claimed before retro_set_environment so callbacks made during setup find us
    if (!ActiveBridge::acquire(this)) {
        report_error(CoreErrorKind::InitializationFailure, "Another core bridge is already active");
        return false;
    }

    m_environment.reset();
    m_options.clear_declared_variables();
    m_core_info = {};
    m_av_info = {};
    m_frame_count = 0;
    m_dropped_runs = 0;
    m_malformed_callbacks = 0;
    {
        std::lock_guard<std::mutex> lock(m_frame_mutex);
        m_last_frame = {};
    }

    std::cout << "[Core] Loading core: " << core_path << std::endl;

    if (!m_loader.open(core_path)) {
        fail_setup(m_loader.get_last_error());
        return false;
    }
    if (!m_loader.resolve(m_entry)) {
        fail_setup(m_loader.get_last_error());
        return false;
    }
    set_state(BridgeState::Loaded);

    if (m_entry.retro_api_version) {
        unsigned api_version = m_entry.retro_api_version();
        if (api_version != RETRO_API_VERSION) {
            CoreError error;
            error.kind = CoreErrorKind::InitializationFailure;
            error.message = "Core API version " + std::to_string(api_version) +
                            " does not match host version " + std::to_string(RETRO_API_VERSION);
            fail_setup(error);
            return false;
        }
    }

    if (m_entry.retro_get_system_info) {
        retro_system_info info{};
        m_entry.retro_get_system_info(&info);
        m_core_info.library_name = info.library_name ? info.library_name : "";
        m_core_info.library_version = info.library_version ? info.library_version : "";
        m_core_info.valid_extensions = info.valid_extensions ? info.valid_extensions : "";
        m_core_info.need_fullpath = info.need_fullpath;
    }
    if (m_core_info.library_name.empty()) {
        m_core_info.library_name = core_path.stem().string();
    }

    m_environment.set_core_name(m_core_info.library_name);
    m_options.set_active_core(m_core_info.library_name);

    m_entry.retro_set_environment(environment_callback);
    m_entry.retro_set_video_refresh(video_refresh_callback);
    m_entry.retro_set_audio_sample(audio_sample_callback);
    m_entry.retro_set_audio_sample_batch(audio_sample_batch_callback);
    m_entry.retro_set_input_poll(input_poll_callback);
    m_entry.retro_set_input_state(input_state_callback);

    m_init_called = true;
    m_entry.retro_init();

    if (m_environment.is_shutdown_requested()) {
        CoreError error;
        error.kind = CoreErrorKind::InitializationFailure;
        error.message = "Core requested shutdown during initialization";
        fail_setup(error);
        return false;
    }

    set_state(BridgeState::Initialized);
    std::cout << "[Core] Initialized " << m_core_info.library_name;
    if (!m_core_info.library_version.empty()) {
        std::cout << " " << m_core_info.library_version;
    }
    std::cout << std::endl;
    return true;
}

bool CoreBridge::read_content(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    m_content_data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool CoreBridge::load_game(const fs::path& content_path) {
    BridgeState state = get_state();
    if (state != BridgeState::Initialized) {
        report_error(CoreErrorKind::GameLoadFailure,
                     std::string("Cannot load content while ") + bridge_state_to_string(state));
        return false;
    }

    std::cout << "[Core] Loading content: " << content_path << std::endl;

    m_content_path = content_path.string();
    m_content_data.clear();

    retro_game_info info{};
    info.path = m_content_path.c_str();
    info.meta = nullptr;

    if (!m_core_info.need_fullpath) {
        if (!read_content(content_path)) {
            report_error(CoreErrorKind::GameLoadFailure, "Could not read content: " + m_content_path);
            m_content_data.clear();
            return false;
        }
        info.data = m_content_data.data();
        info.size = m_content_data.size();
    }

    if (!m_entry.retro_load_game(&info)) {
        report_error(CoreErrorKind::GameLoadFailure, "Core rejected content: " + m_content_path);
        m_content_data.clear();
        return false;
    }
    m_game_loaded = true;

    retro_system_av_info av{};
    m_entry.retro_get_system_av_info(&av);
    m_av_info.base_width = av.geometry.base_width;
    m_av_info.base_height = av.geometry.base_height;
    m_av_info.max_width = av.geometry.max_width;
    m_av_info.max_height = av.geometry.max_height;
    m_av_info.aspect_ratio = av.geometry.aspect_ratio;
    m_av_info.fps = av.timing.fps > 0.0 ? av.timing.fps : 60.0;
    m_av_info.sample_rate = av.timing.sample_rate > 0.0 ? av.timing.sample_rate : 44100.0;

    if (m_environment.is_hardware_render() && m_render_host) {
        m_render_host->configure_geometry(m_av_info.max_width, m_av_info.max_height);
        const retro_hw_render_callback& hw = m_environment.get_hw_render_callback();
        if (hw.context_reset) {
            hw.context_reset();
        }
    }

    set_state(BridgeState::GameLoaded);
    std::cout << "[Core] Content loaded: " << m_av_info.base_width << "x" << m_av_info.base_height
              << " @ " << m_av_info.fps << " fps, " << m_av_info.sample_rate << " Hz" << std::endl;
    return true;
}

bool CoreBridge::start() {
    BridgeState state = get_state();
    if (state == BridgeState::Running) {
        return true;
    }
    if (state != BridgeState::GameLoaded) {
        std::cerr << "[Core] Cannot start while " << bridge_state_to_string(state) << std::endl;
        return false;
    }

    m_pump.arm([this]() { return run_frame(); }, m_av_info.fps);
    set_state(BridgeState::Running);
    std::cout << "[Core] Running at " << m_av_info.fps << " fps" << std::endl;
    return true;
}

bool CoreBridge::run_frame() {
    std::unique_lock<std::mutex> lock(m_run_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        m_dropped_runs.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    BridgeState state = get_state();
    if (state != BridgeState::GameLoaded && state != BridgeState::Running) {
        return false;
    }
    if (m_environment.is_shutdown_requested()) {
        return false;
    }

    m_input.begin_frame();
    m_frame_count.fetch_add(1, std::memory_order_relaxed);
    m_entry.retro_run();

    if (m_environment.is_shutdown_requested()) {
        std::cout << "[Core] Core requested shutdown, stopping frame pump" << std::endl;
        m_pump.disarm();
    }
    return true;
}

bool CoreBridge::reset_game() {
    std::lock_guard<std::mutex> lock(m_run_mutex);

    BridgeState state = get_state();
    if (state != BridgeState::GameLoaded && state != BridgeState::Running) {
        return false;
    }
    if (!m_entry.retro_reset) {
        std::cerr << "[Core] Core does not support reset" << std::endl;
        return false;
    }
    m_entry.retro_reset();
    std::cout << "[Core] Reset" << std::endl;
    return true;
}

void CoreBridge::stop() {
    m_pump.invalidate();

    // Waits for a frame still inside retro_run
    std::lock_guard<std::mutex> lock(m_run_mutex);

    BridgeState state = get_state();
    if (state == BridgeState::Stopped || state == BridgeState::Unloaded) {
        return;
    }

    teardown();
    set_state(BridgeState::Stopped);
    std::cout << "[Core] Stopped " << m_core_info.library_name << std::endl;
}

void CoreBridge::teardown() {
    bool hardware = m_environment.is_hardware_render();

    if (hardware && m_init_called) {
        const retro_hw_render_callback& hw = m_environment.get_hw_render_callback();
        if (hw.context_destroy) {
            hw.context_destroy();
        }
    }

    if (m_game_loaded && m_entry.retro_unload_game) {
        m_entry.retro_unload_game();
    }
    m_game_loaded = false;

    if (m_init_called && m_entry.retro_deinit) {
        m_entry.retro_deinit();
    }
    m_init_called = false;

    if (hardware && m_render_host) {
        m_render_host->destroy_context();
    }

    m_loader.close();
    m_entry = CoreEntryPoints{};
    m_content_data.clear();

    ActiveBridge::release(this);
}

void CoreBridge::fail_setup(const CoreError& error) {
    teardown();
    set_state(BridgeState::Stopped);
    report_error(error.kind, error.message, error.symbol);
}

// =============================================================================
// Errors
// =============================================================================

void CoreBridge::report_error(CoreErrorKind kind, const std::string& message, const std::string& symbol) {
    m_last_error.kind = kind;
    m_last_error.message = message;
    m_last_error.symbol = symbol;

    std::cerr << "[Core] " << core_error_kind_to_string(kind) << ": " << message << std::endl;

    if (m_error_callback) {
        try {
            m_error_callback(m_last_error);
        }
        catch (const std::exception& e) {
            std::cerr << "[Core] Error subscriber threw: " << e.what() << std::endl;
        }
    }
}

void CoreBridge::report_malformed(const std::string& message) {
    m_malformed_callbacks.fetch_add(1, std::memory_order_relaxed);

    // Never fatal: not recorded as the last error
    if (m_error_callback) {
        CoreError error;
        error.kind = CoreErrorKind::MalformedCallback;
        error.message = message;
        try {
            m_error_callback(error);
        }
        catch (const std::exception& e) {
            std::cerr << "[Core] Error subscriber threw: " << e.what() << std::endl;
        }
    }
}

VideoFrame CoreBridge::get_last_frame() const {
    std::lock_guard<std::mutex> lock(m_frame_mutex);
    return m_last_frame;
}

// =============================================================================
// Callback handling
// =============================================================================

void CoreBridge::handle_video_refresh(const void* data, unsigned width, unsigned height, size_t pitch) {
    VideoFrame frame;
    frame.width = width;
    frame.height = height;
    frame.format = m_environment.get_pixel_format();
    frame.frame_number = m_frame_count.load(std::memory_order_relaxed);

    if (data == RETRO_HW_FRAME_BUFFER_VALID) {
        frame.delivery = VideoDelivery::DirectToHostFramebuffer;
        if (m_render_host) {
            auto pixels = std::make_shared<std::vector<uint8_t>>();
            if (m_render_host->read_framebuffer(width, height, *pixels)) {
                frame.pixels = std::move(pixels);
                frame.pitch = static_cast<size_t>(width) * 4;
                frame.format = PixelFormat::XRGB8888;
            }
        }
    }
    else if (!data) {
        // Duplicate: reuse the previous pixels
        frame.delivery = VideoDelivery::Duplicate;
        std::lock_guard<std::mutex> lock(m_frame_mutex);
        frame.pixels = m_last_frame.pixels;
        frame.pitch = m_last_frame.pitch;
        frame.width = m_last_frame.width;
        frame.height = m_last_frame.height;
    }
    else {
        size_t bpp = bytes_per_pixel(frame.format);
        size_t row_bytes = static_cast<size_t>(width) * bpp;
        if (bpp == 0 || width == 0 || height == 0 || pitch < row_bytes) {
            report_malformed("Video refresh with invalid geometry " + std::to_string(width) + "x" +
                             std::to_string(height) + " pitch " + std::to_string(pitch));
            return;
        }

        // The core may reuse its buffer as soon as we return
        auto pixels = std::make_shared<std::vector<uint8_t>>(row_bytes * height);
        const auto* src = static_cast<const uint8_t*>(data);
        uint8_t* dst = pixels->data();
        for (unsigned y = 0; y < height; y++) {
            std::memcpy(dst + y * row_bytes, src + y * pitch, row_bytes);
        }

        frame.delivery = VideoDelivery::CopiedBuffer;
        frame.pixels = std::move(pixels);
        frame.pitch = row_bytes;
    }

    {
        std::lock_guard<std::mutex> lock(m_frame_mutex);
        m_last_frame = frame;
    }

    if (m_frame_callback) {
        m_frame_callback(frame);
    }
}

void CoreBridge::handle_audio(const int16_t* data, size_t frames) {
    convert_s16_to_float(data, frames, m_audio_buffer);
    if (m_audio_callback && !m_audio_buffer.empty()) {
        m_audio_callback(m_audio_buffer.data(), frames, m_av_info.sample_rate);
    }
}

void CoreBridge::handle_log(CoreLogLevel level, const std::string& message) {
    if (m_log_callback) {
        m_log_callback(level, message);
        return;
    }

    std::ostream& out = level >= CoreLogLevel::Warn ? std::cerr : std::cout;
    out << "[" << core_log_level_to_string(level) << "] " << message << std::endl;
}

// =============================================================================
// C trampolines
// =============================================================================

bool RETRO_CALLCONV CoreBridge::environment_callback(unsigned cmd, void* data) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge) {
        return false;
    }
    return bridge->m_environment.handle(cmd, data);
}

void RETRO_CALLCONV CoreBridge::video_refresh_callback(const void* data, unsigned width,
                                                       unsigned height, size_t pitch) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge) return;

    try {
        bridge->handle_video_refresh(data, width, height, pitch);
    }
    catch (const std::exception& e) {
        std::cerr << "[Core] Video refresh failed: " << e.what() << std::endl;
    }
}

void RETRO_CALLCONV CoreBridge::audio_sample_callback(int16_t left, int16_t right) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge) return;

    const int16_t frame[2] = {left, right};
    try {
        bridge->handle_audio(frame, 1);
    }
    catch (const std::exception& e) {
        std::cerr << "[Core] Audio sample failed: " << e.what() << std::endl;
    }
}

size_t RETRO_CALLCONV CoreBridge::audio_sample_batch_callback(const int16_t* data, size_t frames) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge || !data) return 0;

    try {
        bridge->handle_audio(data, frames);
    }
    catch (const std::exception& e) {
        std::cerr << "[Core] Audio batch failed: " << e.what() << std::endl;
    }
    return frames;
}

void RETRO_CALLCONV CoreBridge::input_poll_callback() {
    // Input was captured by begin_frame() before retro_run
}

int16_t RETRO_CALLCONV CoreBridge::input_state_callback(unsigned port, unsigned device,
                                                        unsigned index, unsigned id) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge) return 0;
    return bridge->m_input.query(port, device, index, id);
}

void RETRO_CALLCONV CoreBridge::log_callback(enum retro_log_level level, const char* fmt, ...) {
    if (!fmt) return;

    va_list args;
    va_start(args, fmt);
    std::string message;
    try {
        message = format_log_message(fmt, args);
    }
    catch (const std::exception& e) {
        std::cerr << "[Core] Log formatting failed: " << e.what() << std::endl;
    }
    va_end(args);

    if (message.empty()) return;

    CoreBridge* bridge = ActiveBridge::current();
    CoreLogLevel log_level = static_cast<CoreLogLevel>(level);
    if (!bridge) {
        std::cerr << "[" << core_log_level_to_string(log_level) << "] " << message << std::endl;
        return;
    }

    try {
        bridge->handle_log(log_level, message);
    }
    catch (const std::exception& e) {
        std::cerr << "[Core] Log subscriber threw: " << e.what() << std::endl;
    }
}

uintptr_t RETRO_CALLCONV CoreBridge::hw_get_current_framebuffer() {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge || !bridge->m_render_host) return 0;
    return bridge->m_render_host->get_current_framebuffer();
}

retro_proc_address_t RETRO_CALLCONV CoreBridge::hw_get_proc_address(const char* symbol) {
    CoreBridge* bridge = ActiveBridge::current();
    if (!bridge || !bridge->m_render_host || !symbol) return nullptr;
    return reinterpret_cast<retro_proc_address_t>(bridge->m_render_host->get_proc_address(symbol));
}

} // namespace retrohost
