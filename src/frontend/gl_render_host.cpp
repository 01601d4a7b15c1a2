#include "gl_render_host.hpp"

#include <cstring>
#include <iostream>

namespace retrohost {

GlRenderHost::GlRenderHost(SDL_Window* window)
    : m_window(window) {
}

GlRenderHost::~GlRenderHost() {
    destroy_context();
}

bool GlRenderHost::create_context(const HardwareRenderRequest& request) {
    if (m_context) {
        destroy_context();
    }

    // SDL attributes are process-wide; start from a clean slate
    SDL_GL_ResetAttributes();

    switch (request.api) {
        case HardwareRenderApi::OpenGL:
            if (request.version_major >= 3) {
                SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_COMPATIBILITY);
            }
            break;
        case HardwareRenderApi::OpenGLCore:
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
            break;
        case HardwareRenderApi::OpenGLES2:
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
            break;
        case HardwareRenderApi::OpenGLES3:
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
            break;
        case HardwareRenderApi::OpenGLESVersion:
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
            break;
        default:
            std::cerr << "[GL] Unsupported hardware context: "
                      << hardware_render_api_to_string(request.api) << std::endl;
            return false;
    }

    if (request.api == HardwareRenderApi::OpenGLCore ||
        request.api == HardwareRenderApi::OpenGLESVersion ||
        (request.api == HardwareRenderApi::OpenGL && request.version_major >= 3)) {
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, static_cast<int>(request.version_major));
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, static_cast<int>(request.version_minor));
    }
    if (request.debug_context) {
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_DEBUG_FLAG);
    }

    m_context = SDL_GL_CreateContext(m_window);
    if (!m_context) {
        std::cerr << "[GL] Failed to create context: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_context);

    if (!load_procs()) {
        std::cerr << "[GL] Framebuffer objects not supported by this context" << std::endl;
        destroy_context();
        return false;
    }

    m_request = request;
    if (!allocate_framebuffer(request.width, request.height)) {
        destroy_context();
        return false;
    }

    const char* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    std::cout << "[GL] Context created: " << (version ? version : "unknown version") << std::endl;
    return true;
}

bool GlRenderHost::load_procs() {
    m_glGenFramebuffers = reinterpret_cast<PFNGLGENFRAMEBUFFERSPROC>(SDL_GL_GetProcAddress("glGenFramebuffers"));
    m_glDeleteFramebuffers = reinterpret_cast<PFNGLDELETEFRAMEBUFFERSPROC>(SDL_GL_GetProcAddress("glDeleteFramebuffers"));
    m_glBindFramebuffer = reinterpret_cast<PFNGLBINDFRAMEBUFFERPROC>(SDL_GL_GetProcAddress("glBindFramebuffer"));
    m_glFramebufferTexture2D = reinterpret_cast<PFNGLFRAMEBUFFERTEXTURE2DPROC>(SDL_GL_GetProcAddress("glFramebufferTexture2D"));
    m_glGenRenderbuffers = reinterpret_cast<PFNGLGENRENDERBUFFERSPROC>(SDL_GL_GetProcAddress("glGenRenderbuffers"));
    m_glDeleteRenderbuffers = reinterpret_cast<PFNGLDELETERENDERBUFFERSPROC>(SDL_GL_GetProcAddress("glDeleteRenderbuffers"));
    m_glBindRenderbuffer = reinterpret_cast<PFNGLBINDRENDERBUFFERPROC>(SDL_GL_GetProcAddress("glBindRenderbuffer"));
    m_glRenderbufferStorage = reinterpret_cast<PFNGLRENDERBUFFERSTORAGEPROC>(SDL_GL_GetProcAddress("glRenderbufferStorage"));
    m_glFramebufferRenderbuffer = reinterpret_cast<PFNGLFRAMEBUFFERRENDERBUFFERPROC>(SDL_GL_GetProcAddress("glFramebufferRenderbuffer"));
    m_glCheckFramebufferStatus = reinterpret_cast<PFNGLCHECKFRAMEBUFFERSTATUSPROC>(SDL_GL_GetProcAddress("glCheckFramebufferStatus"));
    m_glBlitFramebuffer = reinterpret_cast<PFNGLBLITFRAMEBUFFERPROC>(SDL_GL_GetProcAddress("glBlitFramebuffer"));

    return m_glGenFramebuffers && m_glDeleteFramebuffers && m_glBindFramebuffer &&
           m_glFramebufferTexture2D && m_glGenRenderbuffers && m_glDeleteRenderbuffers &&
           m_glBindRenderbuffer && m_glRenderbufferStorage && m_glFramebufferRenderbuffer &&
           m_glCheckFramebufferStatus && m_glBlitFramebuffer;
}

bool GlRenderHost::allocate_framebuffer(unsigned width, unsigned height) {
    release_framebuffer();

    if (width == 0 || height == 0) {
        std::cerr << "[GL] Invalid framebuffer size " << width << "x" << height << std::endl;
        return false;
    }

    glGenTextures(1, &m_texture);
    glBindTexture(GL_TEXTURE_2D, m_texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glBindTexture(GL_TEXTURE_2D, 0);

    m_glGenFramebuffers(1, &m_framebuffer);
    m_glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    m_glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_texture, 0);

    if (m_request.depth || m_request.stencil) {
        m_glGenRenderbuffers(1, &m_renderbuffer);
        m_glBindRenderbuffer(GL_RENDERBUFFER, m_renderbuffer);
        if (m_request.stencil) {
            m_glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8,
                                    static_cast<GLsizei>(width), static_cast<GLsizei>(height));
            m_glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, m_renderbuffer);
        } else {
            m_glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24,
                                    static_cast<GLsizei>(width), static_cast<GLsizei>(height));
            m_glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, m_renderbuffer);
        }
        m_glBindRenderbuffer(GL_RENDERBUFFER, 0);
    }

    GLenum status = m_glCheckFramebufferStatus(GL_FRAMEBUFFER);
    if (status != GL_FRAMEBUFFER_COMPLETE) {
        std::cerr << "[GL] Framebuffer incomplete: 0x" << std::hex << status << std::dec << std::endl;
        m_glBindFramebuffer(GL_FRAMEBUFFER, 0);
        release_framebuffer();
        return false;
    }

    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    m_glBindFramebuffer(GL_FRAMEBUFFER, 0);

    m_fb_width = width;
    m_fb_height = height;
    std::cout << "[GL] Framebuffer " << width << "x" << height << std::endl;
    return true;
}

void GlRenderHost::release_framebuffer() {
    if (m_framebuffer && m_glDeleteFramebuffers) {
        m_glDeleteFramebuffers(1, &m_framebuffer);
    }
    if (m_renderbuffer && m_glDeleteRenderbuffers) {
        m_glDeleteRenderbuffers(1, &m_renderbuffer);
    }
    if (m_texture) {
        glDeleteTextures(1, &m_texture);
    }
    m_framebuffer = 0;
    m_renderbuffer = 0;
    m_texture = 0;
    m_fb_width = 0;
    m_fb_height = 0;
}

void GlRenderHost::configure_geometry(unsigned max_width, unsigned max_height) {
    if (!m_context) return;
    if (max_width == m_fb_width && max_height == m_fb_height) return;

    SDL_GL_MakeCurrent(m_window, m_context);
    if (!allocate_framebuffer(max_width, max_height)) {
        std::cerr << "[GL] Keeping previous framebuffer size" << std::endl;
        allocate_framebuffer(m_request.width, m_request.height);
    }
}

void GlRenderHost::destroy_context() {
    if (!m_context) return;

    SDL_GL_MakeCurrent(m_window, m_context);
    release_framebuffer();
    SDL_GL_MakeCurrent(m_window, nullptr);
    SDL_GL_DeleteContext(m_context);
    m_context = nullptr;
    std::cout << "[GL] Context destroyed" << std::endl;
}

void* GlRenderHost::get_proc_address(const char* symbol) {
    return SDL_GL_GetProcAddress(symbol);
}

bool GlRenderHost::read_framebuffer(unsigned width, unsigned height, std::vector<uint8_t>& out) {
    if (!m_readback_enabled || !m_context || !m_framebuffer || width == 0 || height == 0 ||
        width > m_fb_width || height > m_fb_height) {
        return false;
    }

    const size_t row_bytes = static_cast<size_t>(width) * 4;
    out.resize(row_bytes * height);

    m_glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glPixelStorei(GL_PACK_ALIGNMENT, 4);
    // BGRA bytes are XRGB8888 words on little-endian hosts
    glReadPixels(0, 0, static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                 GL_BGRA, GL_UNSIGNED_BYTE, out.data());
    m_glBindFramebuffer(GL_FRAMEBUFFER, 0);

    // GL rows come bottom first; flip when the core drew with a bottom-left origin
    if (m_request.bottom_left_origin) {
        std::vector<uint8_t> row(row_bytes);
        for (unsigned y = 0; y < height / 2; y++) {
            uint8_t* top = out.data() + y * row_bytes;
            uint8_t* bottom = out.data() + (height - 1 - y) * row_bytes;
            std::memcpy(row.data(), top, row_bytes);
            std::memcpy(top, bottom, row_bytes);
            std::memcpy(bottom, row.data(), row_bytes);
        }
    }
    return glGetError() == GL_NO_ERROR;
}

void GlRenderHost::present(unsigned width, unsigned height) {
    if (!m_context || !m_framebuffer) return;

    int window_width = 0;
    int window_height = 0;
    SDL_GL_GetDrawableSize(m_window, &window_width, &window_height);

    m_glBindFramebuffer(GL_READ_FRAMEBUFFER, m_framebuffer);
    m_glBindFramebuffer(GL_DRAW_FRAMEBUFFER, 0);
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    GLint src_w = static_cast<GLint>(width);
    GLint src_h = static_cast<GLint>(height);
    if (m_request.bottom_left_origin) {
        m_glBlitFramebuffer(0, 0, src_w, src_h, 0, 0, window_width, window_height,
                            GL_COLOR_BUFFER_BIT, GL_LINEAR);
    } else {
        m_glBlitFramebuffer(0, 0, src_w, src_h, 0, window_height, window_width, 0,
                            GL_COLOR_BUFFER_BIT, GL_LINEAR);
    }

    m_glBindFramebuffer(GL_FRAMEBUFFER, 0);
    SDL_GL_SwapWindow(m_window);
}

} // namespace retrohost
