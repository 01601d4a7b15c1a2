#pragma once

#include "retrohost/core_types.hpp"
#include <libretro.h>
#include <array>
#include <string>
#include <filesystem>

namespace retrohost {

// Entry points resolved from a libretro core
struct CoreEntryPoints {
    // Required - resolution fails on the first one missing
    void (*retro_init)(void) = nullptr;
    void (*retro_deinit)(void) = nullptr;
    void (*retro_run)(void) = nullptr;
    bool (*retro_load_game)(const struct retro_game_info*) = nullptr;
    void (*retro_get_system_av_info)(struct retro_system_av_info*) = nullptr;
    void (*retro_set_environment)(retro_environment_t) = nullptr;
    void (*retro_set_video_refresh)(retro_video_refresh_t) = nullptr;
    void (*retro_set_audio_sample)(retro_audio_sample_t) = nullptr;
    void (*retro_set_audio_sample_batch)(retro_audio_sample_batch_t) = nullptr;
    void (*retro_set_input_poll)(retro_input_poll_t) = nullptr;
    void (*retro_set_input_state)(retro_input_state_t) = nullptr;

    // Optional - may stay null
    unsigned (*retro_api_version)(void) = nullptr;
    void (*retro_get_system_info)(struct retro_system_info*) = nullptr;
    void (*retro_unload_game)(void) = nullptr;
    void (*retro_reset)(void) = nullptr;

    bool is_complete() const;
};

// Opens a core library and resolves its entry points
// Owns the library handle; the handle is released exactly once.
class CoreLoader {
public:
    // Required symbols in resolution order
    static constexpr std::array<const char*, 11> REQUIRED_SYMBOLS = {
        "retro_init",
        "retro_deinit",
        "retro_run",
        "retro_load_game",
        "retro_get_system_av_info",
        "retro_set_environment",
        "retro_set_video_refresh",
        "retro_set_audio_sample",
        "retro_set_audio_sample_batch",
        "retro_set_input_poll",
        "retro_set_input_state",
    };

    CoreLoader();
    ~CoreLoader();

    // Disable copy
    CoreLoader(const CoreLoader&) = delete;
    CoreLoader& operator=(const CoreLoader&) = delete;

    // Open the library with lazy binding
    // On failure the error kind is LoadFailure.
    bool open(const std::filesystem::path& path);

    // Resolve all required symbols in declared order, then the optional ones
    // Stops at the first missing required symbol (SymbolMissing).
    bool resolve(CoreEntryPoints& entry_points);

    // Release the library. No-op when nothing is open.
    void close();

    bool is_open() const { return m_handle != nullptr; }
    const std::filesystem::path& get_path() const { return m_path; }
    const CoreError& get_last_error() const { return m_last_error; }

    // Look up an arbitrary symbol in the open library
    void* get_symbol(const char* symbol_name) const;

    // Shared library extension for this platform
    static const char* get_library_extension();

private:
    template <typename Fn>
    bool resolve_required(const char* name, Fn& out);

    template <typename Fn>
    void resolve_optional(const char* name, Fn& out);

    void* m_handle = nullptr;
    std::filesystem::path m_path;
    CoreError m_last_error;
};

} // namespace retrohost
