#pragma once

#include <SDL.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace retrohost {

class CoreBridge;
class CoreOptions;
class PathsConfiguration;
class GlRenderHost;
class InputManager;
class AudioManager;

// Main application class - owns the core bridge and the SDL frontend around it
class Application {
public:
    Application();
    ~Application();

    // Disable copy
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Parse arguments, create subsystems, load the core and its content
    // Returns false on error. is_running() is false when there is nothing to do.
    bool initialize(int argc, char* argv[]);

    // Main loop
    void run();

    // Shutdown and cleanup
    void shutdown();

    // Load content into the already initialized core
    bool load_content(const std::string& path);

    bool is_running() const { return m_running; }
    void request_quit() { m_quit_requested = true; }

    bool is_debug_mode() const { return m_debug_mode; }

    // Screenshot of the last frame (empty path: timestamped file in screenshots/)
    bool save_screenshot(const std::string& path = "");

    CoreBridge& get_bridge() { return *m_bridge; }
    PathsConfiguration& get_paths_config() { return *m_paths_config; }
    CoreOptions& get_core_options() { return *m_core_options; }

private:
    bool parse_command_line(int argc, char* argv[]);
    void print_usage(const char* program_name);
    void print_version();

    bool create_window();
    void run_headless();
    void process_events();
    void render();
    void present_software_frame();
    void wait_for_next_frame(uint64_t frame_start, double target_frame_time);

    // Subsystems
    std::unique_ptr<PathsConfiguration> m_paths_config;
    std::unique_ptr<CoreOptions> m_core_options;
    std::unique_ptr<CoreBridge> m_bridge;
    std::unique_ptr<GlRenderHost> m_render_host;
    std::unique_ptr<InputManager> m_input_manager;
    std::unique_ptr<AudioManager> m_audio_manager;

    // Window and software presentation
    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    SDL_Texture* m_texture = nullptr;
    unsigned m_texture_width = 0;
    unsigned m_texture_height = 0;
    uint64_t m_presented_frame = UINT64_MAX;

    std::filesystem::path m_core_path;
    std::string m_content_path;
    std::filesystem::path m_core_options_path;

    // State
    bool m_running = false;
    bool m_quit_requested = false;
    bool m_debug_mode = false;
    bool m_headless_mode = false;  // Run without a window for testing
    int m_headless_frames = 0;     // Frames to run in headless mode
    bool m_audio_started = false;

    // Screenshot
    bool m_screenshot_requested = false;
    int m_screenshot_at_frame = -1;  // Frame number to auto-screenshot (-1 = disabled)
    std::string m_screenshot_output_path;
};

// Global application instance access
Application& get_application();

} // namespace retrohost
