#pragma once

#include "retrohost/core_types.hpp"
#include "retrohost/render_host.hpp"
#include "core_loader.hpp"
#include "environment.hpp"
#include "frame_pump.hpp"
#include "input_state.hpp"

#include <libretro.h>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace retrohost {

class PathsConfiguration;
class CoreOptions;

// Owns one libretro core for its whole lifetime and bridges its callbacks
//
// State machine:
//   Unloaded -> Loaded -> Initialized -> GameLoaded -> Running -> Stopped
// A failed game load leaves the bridge Initialized so another game can be
// tried without reloading the core. Any setup failure tears down and ends
// in Stopped. stop() is idempotent.
//
// The core's callbacks carry no user data, so they reach the bridge through
// ActiveBridge. Only one bridge can hold that slot at a time.
class CoreBridge {
public:
    using FrameCallback = std::function<void(const VideoFrame& frame)>;
    // samples: interleaved stereo floats, frames: stereo pairs
    using AudioCallback = std::function<void(const float* samples, size_t frames, double sample_rate)>;
    using ErrorCallback = std::function<void(const CoreError& error)>;
    using LogCallback = std::function<void(CoreLogLevel level, const std::string& message)>;

    CoreBridge(PathsConfiguration& paths, CoreOptions& options);
    ~CoreBridge();

    // Disable copy
    CoreBridge(const CoreBridge&) = delete;
    CoreBridge& operator=(const CoreBridge&) = delete;

    // Open the core, resolve its entry points, register callbacks and call retro_init
    bool initialize(const std::filesystem::path& core_path);

    // Hand content to the core. Only valid while Initialized.
    bool load_game(const std::filesystem::path& content_path);

    // Arm the frame pump at the core's frame rate
    bool start();

    // Run exactly one frame of the core
    // Returns false without calling the core when another frame is in flight
    // or the core is not ready to run.
    bool run_frame();

    // Soft reset through retro_reset (when the core exports it)
    bool reset_game();

    // Tear everything down: pump, core, render context, library, active slot
    // Must not be called from inside a core callback.
    void stop();

    // Optional hardware render host, set before initialize()
    void set_render_host(IRenderHost* render_host);

    // Host-side subscribers, set before start()
    void set_frame_callback(FrameCallback callback) { m_frame_callback = std::move(callback); }
    void set_audio_callback(AudioCallback callback) { m_audio_callback = std::move(callback); }
    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }
    void set_log_callback(LogCallback callback) { m_log_callback = std::move(callback); }

    BridgeState get_state() const { return m_state.load(std::memory_order_acquire); }
    const CoreError& get_last_error() const { return m_last_error; }
    const AvInfo& get_av_info() const { return m_av_info; }
    const CoreInfo& get_core_info() const { return m_core_info; }
    PixelFormat get_pixel_format() const { return m_environment.get_pixel_format(); }
    bool is_hardware_render() const { return m_environment.is_hardware_render(); }
    bool is_shutdown_requested() const { return m_environment.is_shutdown_requested(); }

    InputStateTable& get_input_state() { return m_input; }
    FramePump& get_frame_pump() { return m_pump; }
    EnvironmentNegotiator& get_environment() { return m_environment; }

    // Most recent frame delivered by the core
    VideoFrame get_last_frame() const;

    uint64_t get_frame_count() const { return m_frame_count.load(std::memory_order_relaxed); }
    uint64_t get_dropped_runs() const { return m_dropped_runs.load(std::memory_order_relaxed); }
    uint64_t get_malformed_callbacks() const { return m_malformed_callbacks.load(std::memory_order_relaxed); }

private:
    // Context-free callbacks handed to the core
    static bool RETRO_CALLCONV environment_callback(unsigned cmd, void* data);
    static void RETRO_CALLCONV video_refresh_callback(const void* data, unsigned width,
                                                      unsigned height, size_t pitch);
    static void RETRO_CALLCONV audio_sample_callback(int16_t left, int16_t right);
    static size_t RETRO_CALLCONV audio_sample_batch_callback(const int16_t* data, size_t frames);
    static void RETRO_CALLCONV input_poll_callback();
    static int16_t RETRO_CALLCONV input_state_callback(unsigned port, unsigned device,
                                                      unsigned index, unsigned id);
    static void RETRO_CALLCONV log_callback(enum retro_log_level level, const char* fmt, ...);
    static uintptr_t RETRO_CALLCONV hw_get_current_framebuffer();
    static retro_proc_address_t RETRO_CALLCONV hw_get_proc_address(const char* symbol);

    void handle_video_refresh(const void* data, unsigned width, unsigned height, size_t pitch);
    void handle_audio(const int16_t* data, size_t frames);
    void handle_log(CoreLogLevel level, const std::string& message);

    void set_state(BridgeState state) { m_state.store(state, std::memory_order_release); }
    void report_error(CoreErrorKind kind, const std::string& message, const std::string& symbol = "");
    void report_malformed(const std::string& message);

    // Record the error, release everything and end in Stopped
    void fail_setup(const CoreError& error);
    void teardown();

    bool read_content(const std::filesystem::path& path);

    CoreOptions& m_options;
    IRenderHost* m_render_host = nullptr;

    CoreLoader m_loader;
    CoreEntryPoints m_entry;
    EnvironmentNegotiator m_environment;
    InputStateTable m_input;
    FramePump m_pump;

    std::atomic<BridgeState> m_state{BridgeState::Unloaded};
    CoreError m_last_error;
    CoreInfo m_core_info;
    AvInfo m_av_info;
    bool m_init_called = false;
    bool m_game_loaded = false;

    // Held for the duration of retro_run; try-locked by run_frame
    std::mutex m_run_mutex;

    mutable std::mutex m_frame_mutex;
    VideoFrame m_last_frame;

    std::atomic<uint64_t> m_frame_count{0};
    std::atomic<uint64_t> m_dropped_runs{0};
    std::atomic<uint64_t> m_malformed_callbacks{0};

    // Content kept alive while the core may reference it
    std::string m_content_path;
    std::vector<uint8_t> m_content_data;

    std::vector<float> m_audio_buffer;

    FrameCallback m_frame_callback;
    AudioCallback m_audio_callback;
    ErrorCallback m_error_callback;
    LogCallback m_log_callback;
};

} // namespace retrohost
