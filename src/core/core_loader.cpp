#include "core_loader.hpp"

#include <iostream>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace retrohost {

bool CoreEntryPoints::is_complete() const {
    return retro_init && retro_deinit && retro_run && retro_load_game &&
           retro_get_system_av_info && retro_set_environment &&
           retro_set_video_refresh && retro_set_audio_sample &&
           retro_set_audio_sample_batch && retro_set_input_poll &&
           retro_set_input_state;
}

CoreLoader::CoreLoader() = default;

CoreLoader::~CoreLoader() {
    close();
}

const char* CoreLoader::get_library_extension() {
#ifdef _WIN32
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

bool CoreLoader::open(const std::filesystem::path& path) {
    close();
    m_last_error = {};
    m_path = path;

#ifdef _WIN32
    m_handle = LoadLibraryW(path.wstring().c_str());
#else
    // Lazy binding: unresolved functions inside the core only fail when called
    m_handle = dlopen(path.c_str(), RTLD_LAZY | RTLD_LOCAL);
#endif

    if (!m_handle) {
        m_last_error.kind = CoreErrorKind::LoadFailure;
#ifdef _WIN32
        m_last_error.message = "Failed to load core " + path.string() +
                               " (error " + std::to_string(GetLastError()) + ")";
#else
        const char* reason = dlerror();
        m_last_error.message = "Failed to load core " + path.string() + ": " +
                               (reason ? reason : "unknown error");
#endif
        std::cerr << "[Loader] " << m_last_error.message << std::endl;
        return false;
    }

    std::cout << "[Loader] Opened core: " << path << std::endl;
    return true;
}

void* CoreLoader::get_symbol(const char* symbol_name) const {
    if (!m_handle || !symbol_name) return nullptr;
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(m_handle), symbol_name));
#else
    return dlsym(m_handle, symbol_name);
#endif
}

template <typename Fn>
bool CoreLoader::resolve_required(const char* name, Fn& out) {
    out = reinterpret_cast<Fn>(get_symbol(name));
    if (!out) {
        m_last_error.kind = CoreErrorKind::SymbolMissing;
        m_last_error.symbol = name;
        m_last_error.message = "Core " + m_path.string() + " is missing required symbol: " + name;
        std::cerr << "[Loader] " << m_last_error.message << std::endl;
        return false;
    }
    return true;
}

template <typename Fn>
void CoreLoader::resolve_optional(const char* name, Fn& out) {
    out = reinterpret_cast<Fn>(get_symbol(name));
}

bool CoreLoader::resolve(CoreEntryPoints& ep) {
    ep = CoreEntryPoints{};
    m_last_error = {};

    if (!m_handle) {
        m_last_error.kind = CoreErrorKind::LoadFailure;
        m_last_error.message = "No core library is open";
        std::cerr << "[Loader] " << m_last_error.message << std::endl;
        return false;
    }

    // Order matches REQUIRED_SYMBOLS
    bool ok = resolve_required(REQUIRED_SYMBOLS[0], ep.retro_init) &&
              resolve_required(REQUIRED_SYMBOLS[1], ep.retro_deinit) &&
              resolve_required(REQUIRED_SYMBOLS[2], ep.retro_run) &&
              resolve_required(REQUIRED_SYMBOLS[3], ep.retro_load_game) &&
              resolve_required(REQUIRED_SYMBOLS[4], ep.retro_get_system_av_info) &&
              resolve_required(REQUIRED_SYMBOLS[5], ep.retro_set_environment) &&
              resolve_required(REQUIRED_SYMBOLS[6], ep.retro_set_video_refresh) &&
              resolve_required(REQUIRED_SYMBOLS[7], ep.retro_set_audio_sample) &&
              resolve_required(REQUIRED_SYMBOLS[8], ep.retro_set_audio_sample_batch) &&
              resolve_required(REQUIRED_SYMBOLS[9], ep.retro_set_input_poll) &&
              resolve_required(REQUIRED_SYMBOLS[10], ep.retro_set_input_state);

    if (!ok) {
        // Partial resolution is never usable
        ep = CoreEntryPoints{};
        return false;
    }

    resolve_optional("retro_api_version", ep.retro_api_version);
    resolve_optional("retro_get_system_info", ep.retro_get_system_info);
    resolve_optional("retro_unload_game", ep.retro_unload_game);
    resolve_optional("retro_reset", ep.retro_reset);

    return true;
}

void CoreLoader::close() {
    if (!m_handle) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(m_handle));
#else
    dlclose(m_handle);
#endif
    m_handle = nullptr;
    std::cout << "[Loader] Closed core: " << m_path << std::endl;
}

} // namespace retrohost
