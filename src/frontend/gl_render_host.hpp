#pragma once

#include "retrohost/render_host.hpp"
#include <SDL.h>
#include <SDL_opengl.h>
#include <cstdint>
#include <vector>

namespace retrohost {

// OpenGL render host on an SDL window
// The core renders into an offscreen framebuffer object; presentation blits
// it to the window's default framebuffer.
class GlRenderHost : public IRenderHost {
public:
    explicit GlRenderHost(SDL_Window* window);
    ~GlRenderHost() override;

    // Disable copy
    GlRenderHost(const GlRenderHost&) = delete;
    GlRenderHost& operator=(const GlRenderHost&) = delete;

    // IRenderHost
    bool create_context(const HardwareRenderRequest& request) override;
    void configure_geometry(unsigned max_width, unsigned max_height) override;
    void destroy_context() override;
    uintptr_t get_current_framebuffer() override { return m_framebuffer; }
    void* get_proc_address(const char* symbol) override;
    bool read_framebuffer(unsigned width, unsigned height, std::vector<uint8_t>& out) override;

    bool has_context() const { return m_context != nullptr; }

    // Readback costs a pipeline stall, so it only runs while enabled
    void set_readback_enabled(bool enabled) { m_readback_enabled = enabled; }

    // Blit the region the core reported to the window and swap
    void present(unsigned width, unsigned height);

private:
    bool load_procs();
    bool allocate_framebuffer(unsigned width, unsigned height);
    void release_framebuffer();

    SDL_Window* m_window = nullptr;
    SDL_GLContext m_context = nullptr;
    HardwareRenderRequest m_request;

    GLuint m_framebuffer = 0;
    GLuint m_texture = 0;
    GLuint m_renderbuffer = 0;
    unsigned m_fb_width = 0;
    unsigned m_fb_height = 0;
    bool m_readback_enabled = false;

    // Framebuffer object entry points resolved through SDL
    PFNGLGENFRAMEBUFFERSPROC m_glGenFramebuffers = nullptr;
    PFNGLDELETEFRAMEBUFFERSPROC m_glDeleteFramebuffers = nullptr;
    PFNGLBINDFRAMEBUFFERPROC m_glBindFramebuffer = nullptr;
    PFNGLFRAMEBUFFERTEXTURE2DPROC m_glFramebufferTexture2D = nullptr;
    PFNGLGENRENDERBUFFERSPROC m_glGenRenderbuffers = nullptr;
    PFNGLDELETERENDERBUFFERSPROC m_glDeleteRenderbuffers = nullptr;
    PFNGLBINDRENDERBUFFERPROC m_glBindRenderbuffer = nullptr;
    PFNGLRENDERBUFFERSTORAGEPROC m_glRenderbufferStorage = nullptr;
    PFNGLFRAMEBUFFERRENDERBUFFERPROC m_glFramebufferRenderbuffer = nullptr;
    PFNGLCHECKFRAMEBUFFERSTATUSPROC m_glCheckFramebufferStatus = nullptr;
    PFNGLBLITFRAMEBUFFERPROC m_glBlitFramebuffer = nullptr;
};

} // namespace retrohost
