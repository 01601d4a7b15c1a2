#include "application.hpp"
#include "audio_manager.hpp"
#include "gl_render_host.hpp"
#include "input_manager.hpp"
#include "core/core_bridge.hpp"
#include "core/core_options.hpp"
#include "core/paths_config.hpp"
#include "core/screenshot.hpp"
#include "retrohost/core_types.hpp"

#include <SDL.h>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace retrohost {

// Global application instance
static Application* g_application = nullptr;

Application& get_application() {
    return *g_application;
}

Application::Application() {
    g_application = this;
}

Application::~Application() {
    if (g_application == this) {
        g_application = nullptr;
    }
}

void Application::print_usage(const char* program_name) {
    std::cout << "retrohost - a host for libretro cores\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] CORE [CONTENT]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help       Show this help message and exit\n";
    std::cout << "  -v, --version    Show version information and exit\n";
    std::cout << "  -d, --debug      Show core debug log messages\n";
    std::cout << "\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  HEADLESS=1       Run without a window (for automated testing)\n";
    std::cout << "  FRAMES=N         Run for N frames then exit (requires HEADLESS=1)\n";
    std::cout << "  SAVE_SCREENSHOT=N      Save screenshot at frame N\n";
    std::cout << "  SAVE_SCREENSHOT=path   Save screenshot at exit to specified path\n";
    std::cout << "\n";
    std::cout << "CORE:\n";
    std::cout << "  Path to a libretro core (" << CoreLoader::get_library_extension() << ")\n";
    std::cout << "CONTENT:\n";
    std::cout << "  Game or disc image handed to the core. Files can also be dropped on the window.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " ppsspp_libretro.so game.iso\n";
    std::cout << "  HEADLESS=1 FRAMES=600 " << program_name << " core.so test.bin\n";
}

void Application::print_version() {
    std::cout << "retrohost v" << RETROHOST_VERSION_STRING << "\n";
    std::cout << "libretro API version " << RETRO_API_VERSION << "\n";
}

bool Application::parse_command_line(int argc, char* argv[]) {
    m_core_path.clear();
    m_content_path.clear();

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return false;  // Signal to exit
        }
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return false;  // Signal to exit
        }
        else if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--debug") == 0) {
            m_debug_mode = true;
            std::cout << "Debug mode enabled\n";
        }
        else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else if (m_core_path.empty()) {
            m_core_path = arg;
        }
        else {
            m_content_path = arg;
        }
    }

    if (m_core_path.empty()) {
        print_usage(argv[0]);
        return false;
    }
    return true;
}

bool Application::initialize(int argc, char* argv[]) {
    if (!parse_command_line(argc, argv)) {
        m_running = false;
        return true;  // Not an error, just exit gracefully
    }

    const char* headless_env = std::getenv("HEADLESS");
    if (headless_env && headless_env[0] != '0') {
        m_headless_mode = true;
    }

    const char* frames_env = std::getenv("FRAMES");
    if (frames_env) {
        m_headless_frames = std::atoi(frames_env);
        if (m_headless_frames <= 0) {
            m_headless_frames = 600;  // Default to 10 seconds at 60fps
        }
    }

    // Frame number or output path
    const char* screenshot_env = std::getenv("SAVE_SCREENSHOT");
    if (screenshot_env) {
        int frame_num = std::atoi(screenshot_env);
        if (frame_num > 0) {
            m_screenshot_at_frame = frame_num;
        } else if (screenshot_env[0] != '\0') {
            m_screenshot_output_path = screenshot_env;
            m_screenshot_at_frame = -2;  // -2 means screenshot at exit
        }
    }

    if (m_headless_mode) {
        if (m_content_path.empty()) {
            std::cerr << "Error: HEADLESS=1 requires a content file\n";
            return false;
        }
        if (m_headless_frames == 0) {
            m_headless_frames = 600;
        }
    }

    // Paths first, the bridge hands these directories to the core
    m_paths_config = std::make_unique<PathsConfiguration>();
    m_paths_config->initialize(std::filesystem::current_path());
    if (!m_paths_config->load()) {
        std::cerr << "Warning: using default paths" << std::endl;
    }
    if (!m_paths_config->ensure_directories_exist()) {
        std::cerr << "Warning: some configured directories could not be created" << std::endl;
    }

    m_core_options = std::make_unique<CoreOptions>();
    m_core_options_path = m_paths_config->get_config_directory() / "core_options.json";
    if (!m_core_options->load(m_core_options_path)) {
        std::cerr << "Warning: ignoring unreadable core options" << std::endl;
    }

    m_bridge = std::make_unique<CoreBridge>(*m_paths_config, *m_core_options);
    m_bridge->set_log_callback([this](CoreLogLevel level, const std::string& message) {
        if (level == CoreLogLevel::Debug && !m_debug_mode) {
            return;
        }
        std::ostream& out = level >= CoreLogLevel::Warn ? std::cerr : std::cout;
        out << "[" << core_log_level_to_string(level) << "] " << message << std::endl;
    });

    if (!m_headless_mode) {
        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_GAMECONTROLLER) < 0) {
            std::cerr << "Failed to initialize SDL: " << SDL_GetError() << std::endl;
            return false;
        }

        if (!create_window()) {
            return false;
        }

        m_render_host = std::make_unique<GlRenderHost>(m_window);
        m_bridge->set_render_host(m_render_host.get());

        m_input_manager = std::make_unique<InputManager>();
        if (!m_input_manager->initialize(m_bridge->get_input_state())) {
            std::cerr << "Failed to initialize input manager" << std::endl;
            return false;
        }

        m_audio_manager = std::make_unique<AudioManager>();
        if (!m_audio_manager->initialize()) {
            std::cerr << "Failed to initialize audio manager" << std::endl;
            return false;
        }

        AudioManager* audio_mgr = m_audio_manager.get();
        m_bridge->set_audio_callback([audio_mgr](const float* samples, size_t frames, double rate) {
            // frames are stereo pairs
            audio_mgr->push_samples_resampled(samples, frames * 2, rate);
        });
    }

    if (!m_bridge->initialize(m_core_path)) {
        std::cerr << "Failed to initialize core: " << m_bridge->get_last_error().message << std::endl;
        return false;
    }

    if (!m_content_path.empty()) {
        if (!load_content(m_content_path) && m_headless_mode) {
            return false;
        }
    }

    m_running = true;
    std::cout << "retrohost initialized with " << m_bridge->get_core_info().library_name << std::endl;
    return true;
}

bool Application::create_window() {
    m_window = SDL_CreateWindow("retrohost",
                                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                960, 544,
                                SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!m_window) {
        std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

bool Application::load_content(const std::string& path) {
    std::cout << "Loading content: " << path << std::endl;

    // A core holds one game for its lifetime; reload it for new content
    BridgeState state = m_bridge->get_state();
    if (state == BridgeState::GameLoaded || state == BridgeState::Running) {
        m_bridge->stop();
    }
    if (m_bridge->get_state() == BridgeState::Stopped) {
        if (!m_bridge->initialize(m_core_path)) {
            std::cerr << "Failed to reinitialize core: " << m_bridge->get_last_error().message << std::endl;
            return false;
        }
    }

    if (!m_bridge->load_game(path)) {
        // The core stays initialized, another file can be tried
        std::cerr << "Failed to load content: " << m_bridge->get_last_error().message << std::endl;
        return false;
    }

    if (!m_bridge->start()) {
        return false;
    }
    m_content_path = path;

    if (!m_headless_mode) {
        // Software cores draw through an SDL renderer; hardware cores own the GL context
        if (!m_bridge->is_hardware_render() && !m_renderer) {
            m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED);
            if (!m_renderer) {
                std::cerr << "Failed to create renderer: " << SDL_GetError() << std::endl;
                return false;
            }
        }

        std::string title = "retrohost - " + m_bridge->get_core_info().library_name + " - " +
                            std::filesystem::path(path).filename().string();
        SDL_SetWindowTitle(m_window, title.c_str());

        m_audio_manager->pause();
        m_audio_manager->clear_buffer();
        m_audio_started = false;
    }

    std::cout << "Content loaded successfully" << std::endl;
    return true;
}

void Application::run() {
    if (m_headless_mode) {
        run_headless();
        return;
    }

    while (m_running && !m_quit_requested) {
        uint64_t frame_start = SDL_GetPerformanceCounter();

        process_events();

        FramePump& pump = m_bridge->get_frame_pump();
        if (pump.tick() == FramePump::TickResult::Ran) {
            // Start audio playback once buffer has enough samples
            if (!m_audio_started && m_audio_manager->is_buffer_ready()) {
                m_audio_manager->resume();
                m_audio_started = true;
            }

            if (m_screenshot_requested) {
                m_screenshot_requested = false;
                save_screenshot();
                if (m_render_host) {
                    m_render_host->set_readback_enabled(false);
                }
            }
        }

        if (m_bridge->is_shutdown_requested()) {
            std::cout << "Core requested shutdown" << std::endl;
            m_quit_requested = true;
            break;
        }

        render();

        double fps = pump.is_armed() ? pump.get_target_fps() : 60.0;
        wait_for_next_frame(frame_start, 1.0 / fps);
    }
}

void Application::run_headless() {
    if (m_bridge->get_state() != BridgeState::Running) {
        std::cerr << "No content running for headless mode\n";
        return;
    }

    FramePump& pump = m_bridge->get_frame_pump();
    int frames_run = 0;

    while (m_running && !m_quit_requested && frames_run < m_headless_frames) {
        if (pump.tick() != FramePump::TickResult::Ran) {
            break;
        }
        frames_run++;

        if (m_screenshot_at_frame > 0 && frames_run == m_screenshot_at_frame) {
            std::string path = m_screenshot_output_path.empty()
                ? ("screenshot_frame_" + std::to_string(frames_run) + ".png")
                : m_screenshot_output_path;
            save_screenshot(path);
        }

        if (m_bridge->is_shutdown_requested()) {
            break;
        }
    }

    if (m_screenshot_at_frame == -2) {
        std::string path = m_screenshot_output_path.empty()
            ? "screenshot_final.png"
            : m_screenshot_output_path;
        save_screenshot(path);
    }

    std::cerr << "Headless mode: Ran " << frames_run << " frames ("
              << pump.get_frames_dropped() << " dropped)\n";
}

void Application::wait_for_next_frame(uint64_t frame_start, double target_frame_time) {
    double frequency = static_cast<double>(SDL_GetPerformanceFrequency());
    double frame_time = static_cast<double>(SDL_GetPerformanceCounter() - frame_start) / frequency;
    if (frame_time >= target_frame_time) {
        return;
    }

    // Sleep slightly less than needed and spin for the remainder
    double sleep_time = (target_frame_time - frame_time) * 1000.0;
    if (sleep_time > 2.0) {
        SDL_Delay(static_cast<uint32_t>(sleep_time - 1.0));
    }
    while (true) {
        double elapsed = static_cast<double>(SDL_GetPerformanceCounter() - frame_start) / frequency;
        if (elapsed >= target_frame_time) break;
    }
}

void Application::process_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        m_input_manager->process_event(event);

        switch (event.type) {
            case SDL_QUIT:
                m_quit_requested = true;
                break;

            case SDL_WINDOWEVENT:
                if (event.window.event == SDL_WINDOWEVENT_CLOSE) {
                    m_quit_requested = true;
                }
                break;

            case SDL_KEYDOWN:
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        m_quit_requested = true;
                        break;
                    case SDLK_r:
                        if (event.key.keysym.mod & KMOD_CTRL) {
                            m_bridge->reset_game();
                        }
                        break;
                    case SDLK_PRINTSCREEN:
                    case SDLK_F12:
                        // Taken after the next frame so hardware cores can read back
                        m_screenshot_requested = true;
                        if (m_render_host) {
                            m_render_host->set_readback_enabled(true);
                        }
                        break;
                }
                break;

            case SDL_DROPFILE:
                load_content(event.drop.file);
                SDL_free(event.drop.file);
                break;
        }
    }
}

void Application::render() {
    if (m_bridge->get_state() != BridgeState::Running) {
        if (m_renderer) {
            SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
            SDL_RenderClear(m_renderer);
            SDL_RenderPresent(m_renderer);
        }
        return;
    }

    if (m_bridge->is_hardware_render()) {
        VideoFrame frame = m_bridge->get_last_frame();
        if (frame.width > 0 && frame.height > 0) {
            m_render_host->present(frame.width, frame.height);
        }
        return;
    }

    present_software_frame();
}

void Application::present_software_frame() {
    if (!m_renderer) return;

    VideoFrame frame = m_bridge->get_last_frame();
    if (frame.has_pixels() && frame.frame_number != m_presented_frame) {
        if (!m_texture || frame.width != m_texture_width || frame.height != m_texture_height) {
            if (m_texture) {
                SDL_DestroyTexture(m_texture);
            }
            // SDL_PIXELFORMAT_RGB888 is 32-bit XRGB
            m_texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGB888, SDL_TEXTUREACCESS_STREAMING,
                                          static_cast<int>(frame.width), static_cast<int>(frame.height));
            if (!m_texture) {
                std::cerr << "Failed to create frame texture: " << SDL_GetError() << std::endl;
                return;
            }
            m_texture_width = frame.width;
            m_texture_height = frame.height;
        }

        SDL_UpdateTexture(m_texture, nullptr, frame.pixels->data(), static_cast<int>(frame.pitch));
        m_presented_frame = frame.frame_number;
    }

    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
    SDL_RenderClear(m_renderer);
    if (m_texture) {
        // Letterbox to the core's aspect ratio
        int window_w = 0;
        int window_h = 0;
        SDL_GetRendererOutputSize(m_renderer, &window_w, &window_h);

        float aspect = m_bridge->get_av_info().aspect_ratio;
        if (aspect <= 0.0f) {
            aspect = static_cast<float>(m_texture_width) / static_cast<float>(m_texture_height);
        }

        SDL_Rect dst{0, 0, window_w, window_h};
        if (static_cast<float>(window_w) / static_cast<float>(window_h) > aspect) {
            dst.w = static_cast<int>(static_cast<float>(window_h) * aspect);
            dst.x = (window_w - dst.w) / 2;
        } else {
            dst.h = static_cast<int>(static_cast<float>(window_w) / aspect);
            dst.y = (window_h - dst.h) / 2;
        }
        SDL_RenderCopy(m_renderer, m_texture, nullptr, &dst);
    }
    SDL_RenderPresent(m_renderer);
}

void Application::shutdown() {
    // Core first: it may still reference the render context and directories
    if (m_bridge) {
        m_bridge->stop();
        m_bridge.reset();
    }

    if (m_paths_config && m_paths_config->is_modified() && !m_paths_config->save()) {
        std::cerr << "Warning: paths configuration not saved" << std::endl;
    }
    if (m_core_options && m_core_options->is_modified() && !m_core_options->save(m_core_options_path)) {
        std::cerr << "Warning: core options not saved" << std::endl;
    }

    // Shutdown and destroy managers in controlled order
    if (m_audio_manager) {
        m_audio_manager->shutdown();
        m_audio_manager.reset();
    }
    if (m_input_manager) {
        m_input_manager->shutdown();
        m_input_manager.reset();
    }
    if (m_render_host) {
        m_render_host->destroy_context();
        m_render_host.reset();
    }
    if (m_texture) {
        SDL_DestroyTexture(m_texture);
        m_texture = nullptr;
    }
    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    m_core_options.reset();
    m_paths_config.reset();

    if (!m_headless_mode) {
        SDL_Quit();
        std::cout << "retrohost shutdown complete" << std::endl;
    }
}

bool Application::save_screenshot(const std::string& path) {
    VideoFrame frame = m_bridge ? m_bridge->get_last_frame() : VideoFrame{};
    if (!frame.has_pixels()) {
        std::cerr << "[Screenshot] No frame available\n";
        return false;
    }

    std::filesystem::path output_path;
    if (path.empty()) {
        output_path = m_paths_config->get_screenshot_directory() / Screenshot::generate_filename();
    } else {
        output_path = path;
    }

    return Screenshot::save_png(output_path, frame);
}

} // namespace retrohost
