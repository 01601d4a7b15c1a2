#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#define RETROHOST_VERSION_STRING "0.1.0"

namespace retrohost {

// Pixel formats a core may request through SET_PIXEL_FORMAT
// Values match the libretro enumeration
enum class PixelFormat : uint32_t {
    RGB1555 = 0,    // 0RGB1555, 15-bit native endian
    XRGB8888 = 1,   // 32-bit, top byte ignored
    RGB565 = 2,     // 16-bit
    Unknown = 0xFFFFFFFF
};

inline const char* pixel_format_to_string(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGB1555:  return "0RGB1555";
        case PixelFormat::XRGB8888: return "XRGB8888";
        case PixelFormat::RGB565:   return "RGB565";
        default:                    return "Unknown";
    }
}

inline size_t bytes_per_pixel(PixelFormat format) {
    switch (format) {
        case PixelFormat::XRGB8888: return 4;
        case PixelFormat::RGB1555:
        case PixelFormat::RGB565:   return 2;
        default:                    return 0;
    }
}

// Lifecycle of a loaded core
// Unloaded -> Loaded -> Initialized -> GameLoaded -> Running -> Stopped
enum class BridgeState {
    Unloaded,       // No library open
    Loaded,         // Library open, symbols resolved
    Initialized,    // retro_init returned
    GameLoaded,     // retro_load_game succeeded
    Running,        // Frame pump armed
    Stopped         // Torn down, handle released
};

inline const char* bridge_state_to_string(BridgeState state) {
    switch (state) {
        case BridgeState::Unloaded:    return "Unloaded";
        case BridgeState::Loaded:      return "Loaded";
        case BridgeState::Initialized: return "Initialized";
        case BridgeState::GameLoaded:  return "GameLoaded";
        case BridgeState::Running:     return "Running";
        case BridgeState::Stopped:     return "Stopped";
        default:                       return "Unknown";
    }
}

enum class CoreErrorKind {
    None,
    LoadFailure,            // Library missing or not loadable
    SymbolMissing,          // A required entry point is absent
    InitializationFailure,  // Core rejected setup (API version, shutdown during init)
    GameLoadFailure,        // retro_load_game returned false; core stays initialized
    MalformedCallback       // Core passed a null or invalid payload
};

inline const char* core_error_kind_to_string(CoreErrorKind kind) {
    switch (kind) {
        case CoreErrorKind::None:                  return "None";
        case CoreErrorKind::LoadFailure:           return "LoadFailure";
        case CoreErrorKind::SymbolMissing:         return "SymbolMissing";
        case CoreErrorKind::InitializationFailure: return "InitializationFailure";
        case CoreErrorKind::GameLoadFailure:       return "GameLoadFailure";
        case CoreErrorKind::MalformedCallback:     return "MalformedCallback";
        default:                                   return "Unknown";
    }
}

struct CoreError {
    CoreErrorKind kind = CoreErrorKind::None;
    std::string message;
    std::string symbol;     // Only set for SymbolMissing

    bool is_error() const { return kind != CoreErrorKind::None; }
};

// Severity of a message a core logs through the log interface
enum class CoreLogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

inline const char* core_log_level_to_string(CoreLogLevel level) {
    switch (level) {
        case CoreLogLevel::Debug: return "DEBUG";
        case CoreLogLevel::Info:  return "INFO";
        case CoreLogLevel::Warn:  return "WARN";
        case CoreLogLevel::Error: return "ERROR";
        default:                  return "LOG";
    }
}

// How a video frame reached the host
enum class VideoDelivery {
    CopiedBuffer,               // Software frame, rows copied out of core memory
    DirectToHostFramebuffer,    // Core rendered into the host framebuffer
    Duplicate                   // Core asked to repeat the previous frame
};

// A single frame handed to frame subscribers
// Pixel data, when present, is an owned copy and never aliases core memory.
struct VideoFrame {
    VideoDelivery delivery = VideoDelivery::CopiedBuffer;
    std::shared_ptr<const std::vector<uint8_t>> pixels;
    unsigned width = 0;
    unsigned height = 0;
    size_t pitch = 0;       // Bytes per row in pixels
    PixelFormat format = PixelFormat::XRGB8888;
    uint64_t frame_number = 0;

    bool has_pixels() const { return pixels && !pixels->empty(); }
};

// Audio/video timing reported by the core after a game is loaded
struct AvInfo {
    unsigned base_width = 0;
    unsigned base_height = 0;
    unsigned max_width = 0;
    unsigned max_height = 0;
    float aspect_ratio = 0.0f;
    double fps = 60.0;
    double sample_rate = 44100.0;
};

// Values reported by retro_get_system_info
struct CoreInfo {
    std::string library_name;
    std::string library_version;
    std::string valid_extensions;
    bool need_fullpath = false;
};

} // namespace retrohost
