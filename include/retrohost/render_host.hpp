#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace retrohost {

// Graphics API a core may request for hardware rendering
enum class HardwareRenderApi {
    None,
    OpenGL,         // Compatibility profile
    OpenGLCore,     // Core profile, version in request
    OpenGLES2,
    OpenGLES3,
    OpenGLESVersion,
    Vulkan,
    Other
};

inline const char* hardware_render_api_to_string(HardwareRenderApi api) {
    switch (api) {
        case HardwareRenderApi::None:            return "None";
        case HardwareRenderApi::OpenGL:          return "OpenGL";
        case HardwareRenderApi::OpenGLCore:      return "OpenGLCore";
        case HardwareRenderApi::OpenGLES2:       return "OpenGLES2";
        case HardwareRenderApi::OpenGLES3:       return "OpenGLES3";
        case HardwareRenderApi::OpenGLESVersion: return "OpenGLESVersion";
        case HardwareRenderApi::Vulkan:          return "Vulkan";
        default:                                 return "Other";
    }
}

// What the core asked for in SET_HW_RENDER
struct HardwareRenderRequest {
    HardwareRenderApi api = HardwareRenderApi::None;
    unsigned version_major = 0;
    unsigned version_minor = 0;
    bool depth = false;
    bool stencil = false;
    bool bottom_left_origin = false;
    bool debug_context = false;
    unsigned width = 640;       // Initial framebuffer size, resized after load_game
    unsigned height = 480;
};

// Host side of the hardware render path
// The render host owns the GPU context and the framebuffer object the core draws into.
class IRenderHost {
public:
    virtual ~IRenderHost() = default;

    // Allocate a context and framebuffer matching the request
    // Returning false declines SET_HW_RENDER.
    virtual bool create_context(const HardwareRenderRequest& request) = 0;

    // Resize the framebuffer once the core reports its geometry
    virtual void configure_geometry(unsigned max_width, unsigned max_height) = 0;

    // Release the context and framebuffer. Safe to call more than once.
    virtual void destroy_context() = 0;

    // Framebuffer object the core should render into
    virtual uintptr_t get_current_framebuffer() = 0;

    // Resolve a graphics API entry point for the core
    virtual void* get_proc_address(const char* symbol) = 0;

    // Read back the last rendered frame as XRGB8888 rows (top row first)
    // Hosts that cannot read back leave out unchanged and return false.
    virtual bool read_framebuffer(unsigned width, unsigned height, std::vector<uint8_t>& out) {
        (void)width;
        (void)height;
        (void)out;
        return false;
    }
};

} // namespace retrohost
