// Minimal libretro core used by the bridge tests
//
// MOCK_CORE_HW_RENDER    requests OpenGL hardware rendering in retro_load_game
// MOCK_CORE_OMIT_SYMBOLS leaves out retro_set_audio_sample_batch and retro_set_input_state

#include "mock_core_control.h"

#include <libretro.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

#define MOCK_EXPORT extern "C" __attribute__((visibility("default")))

namespace {

retro_environment_t s_environment = nullptr;
retro_video_refresh_t s_video_refresh = nullptr;
retro_audio_sample_t s_audio_sample = nullptr;
retro_audio_sample_batch_t s_audio_batch = nullptr;
retro_input_poll_t s_input_poll = nullptr;
retro_input_state_t s_input_state = nullptr;
retro_log_printf_t s_log = nullptr;

MockCounters s_counters{};
std::atomic<bool> s_block_run{false};
std::atomic<bool> s_in_run{false};
bool s_shutdown_on_init = false;
bool s_shutdown_on_run = false;
bool s_dupe_frames = false;
MockMidFrameHook s_hook = nullptr;
void* s_hook_user_data = nullptr;

int16_t s_query_before = 0;
int16_t s_query_after = 0;
std::string s_system_dir;
std::string s_save_dir;
std::string s_assets_dir;
std::string s_option_value;
size_t s_batch_return = 0;
uintptr_t s_framebuffer_seen = 0;
bool s_hw_accepted = false;
retro_hw_render_callback s_hw{};

uint32_t s_frame[MOCK_FRAME_PITCH / 4 * MOCK_FRAME_HEIGHT];

const retro_variable s_variables[] = {
    {"mock_option", "Mock option; alpha|beta"},
    {nullptr, nullptr},
};

void query_directory(unsigned cmd, std::string& out) {
    const char* dir = nullptr;
    if (s_environment(cmd, &dir) && dir) {
        out = dir;
    } else {
        out.clear();
    }
}

void context_reset() {
    s_counters.context_reset++;
}

void context_destroy() {
    s_counters.context_destroy++;
}

void fill_frame(unsigned frame) {
    const unsigned stride = MOCK_FRAME_PITCH / 4;
    for (unsigned y = 0; y < MOCK_FRAME_HEIGHT; y++) {
        for (unsigned x = 0; x < stride; x++) {
            uint32_t value = x < MOCK_FRAME_WIDTH
                ? ((frame & 0xFFu) << 16) | ((y & 0xFFu) << 8) | (x & 0xFFu)
                : 0xFFFFFFFFu;
            s_frame[y * stride + x] = value;
        }
    }
}

} // namespace

// =============================================================================
// libretro API
// =============================================================================

RETRO_API unsigned retro_api_version(void) {
    return RETRO_API_VERSION;
}

RETRO_API void retro_set_environment(retro_environment_t cb) {
    s_environment = cb;
    s_environment(RETRO_ENVIRONMENT_SET_VARIABLES, const_cast<retro_variable*>(s_variables));
}

RETRO_API void retro_set_video_refresh(retro_video_refresh_t cb) { s_video_refresh = cb; }
RETRO_API void retro_set_audio_sample(retro_audio_sample_t cb) { s_audio_sample = cb; }
RETRO_API void retro_set_input_poll(retro_input_poll_t cb) { s_input_poll = cb; }

#ifndef MOCK_CORE_OMIT_SYMBOLS
RETRO_API void retro_set_audio_sample_batch(retro_audio_sample_batch_t cb) { s_audio_batch = cb; }
RETRO_API void retro_set_input_state(retro_input_state_t cb) { s_input_state = cb; }
#endif

RETRO_API void retro_get_system_info(struct retro_system_info* info) {
    std::memset(info, 0, sizeof(*info));
    info->library_name = "MockCore";
    info->library_version = "1.0";
    info->valid_extensions = "bin|mock";
    info->need_fullpath = true;
    info->block_extract = false;
}

RETRO_API void retro_init(void) {
    s_counters.init++;

    retro_log_callback logging{};
    if (s_environment(RETRO_ENVIRONMENT_GET_LOG_INTERFACE, &logging)) {
        s_log = logging.log;
    }
    if (s_log) {
        s_log(RETRO_LOG_INFO, "mock core %s %d\n", "ready", 42);
    }

    query_directory(RETRO_ENVIRONMENT_GET_SYSTEM_DIRECTORY, s_system_dir);
    query_directory(RETRO_ENVIRONMENT_GET_SAVE_DIRECTORY, s_save_dir);
    query_directory(RETRO_ENVIRONMENT_GET_CORE_ASSETS_DIRECTORY, s_assets_dir);

    retro_pixel_format format = RETRO_PIXEL_FORMAT_XRGB8888;
    s_environment(RETRO_ENVIRONMENT_SET_PIXEL_FORMAT, &format);

    retro_variable variable{"mock_option", nullptr};
    if (s_environment(RETRO_ENVIRONMENT_GET_VARIABLE, &variable) && variable.value) {
        s_option_value = variable.value;
    } else {
        s_option_value.clear();
    }

    if (s_shutdown_on_init) {
        s_environment(RETRO_ENVIRONMENT_SHUTDOWN, nullptr);
    }
}

RETRO_API void retro_deinit(void) {
    s_counters.deinit++;
    s_log = nullptr;
}

RETRO_API void retro_get_system_av_info(struct retro_system_av_info* info) {
    std::memset(info, 0, sizeof(*info));
    info->geometry.base_width = MOCK_FRAME_WIDTH;
    info->geometry.base_height = MOCK_FRAME_HEIGHT;
    info->geometry.max_width = MOCK_FRAME_WIDTH * 2;
    info->geometry.max_height = MOCK_FRAME_HEIGHT * 2;
    info->geometry.aspect_ratio = 2.0f;
    info->timing.fps = 60.0;
    info->timing.sample_rate = 48000.0;
}

RETRO_API bool retro_load_game(const struct retro_game_info* game) {
    if (!game || !game->path) {
        return false;
    }

    FILE* file = std::fopen(game->path, "rb");
    if (!file) {
        if (s_log) {
            s_log(RETRO_LOG_ERROR, "cannot open %s\n", game->path);
        }
        return false;
    }
    std::fclose(file);

#ifdef MOCK_CORE_HW_RENDER
    s_hw = retro_hw_render_callback{};
    s_hw.context_type = RETRO_HW_CONTEXT_OPENGL_CORE;
    s_hw.version_major = 3;
    s_hw.version_minor = 3;
    s_hw.depth = true;
    s_hw.stencil = true;
    s_hw.bottom_left_origin = true;
    s_hw.context_reset = context_reset;
    s_hw.context_destroy = context_destroy;
    s_hw_accepted = s_environment(RETRO_ENVIRONMENT_SET_HW_RENDER, &s_hw);
    if (!s_hw_accepted) {
        return false;
    }
#endif

    s_counters.load_game++;
    return true;
}

RETRO_API bool retro_load_game_special(unsigned, const struct retro_game_info*, size_t) {
    return false;
}

RETRO_API void retro_unload_game(void) {
    s_counters.unload_game++;
}

RETRO_API void retro_reset(void) {
    s_counters.reset++;
}

RETRO_API void retro_run(void) {
    s_in_run = true;
    s_counters.run++;

    while (s_block_run.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    s_input_poll();
    s_query_before = s_input_state ? s_input_state(0, RETRO_DEVICE_JOYPAD, 0, RETRO_DEVICE_ID_JOYPAD_A) : 0;
    if (s_hook) {
        s_hook(s_hook_user_data);
    }
    s_query_after = s_input_state ? s_input_state(0, RETRO_DEVICE_JOYPAD, 0, RETRO_DEVICE_ID_JOYPAD_A) : 0;

#ifdef MOCK_CORE_HW_RENDER
    if (s_hw.get_current_framebuffer) {
        s_framebuffer_seen = s_hw.get_current_framebuffer();
    }
    s_video_refresh(RETRO_HW_FRAME_BUFFER_VALID, MOCK_FRAME_WIDTH, MOCK_FRAME_HEIGHT, 0);
#else
    if (s_dupe_frames && s_counters.run > 1) {
        s_video_refresh(nullptr, MOCK_FRAME_WIDTH, MOCK_FRAME_HEIGHT, 0);
    } else {
        fill_frame(static_cast<unsigned>(s_counters.run));
        s_video_refresh(s_frame, MOCK_FRAME_WIDTH, MOCK_FRAME_HEIGHT, MOCK_FRAME_PITCH);
        // The host must have copied the frame by now
        std::memset(s_frame, 0xAB, sizeof(s_frame));
    }
#endif

    static const int16_t batch[MOCK_AUDIO_BATCH_FRAMES * 2] = {
        0, 32767, -32768, 16384, -16384, 1, 100, -100,
    };
    if (s_audio_batch) {
        s_batch_return = s_audio_batch(batch, MOCK_AUDIO_BATCH_FRAMES);
    }
    s_audio_sample(1000, -1000);

    if (s_shutdown_on_run) {
        s_environment(RETRO_ENVIRONMENT_SHUTDOWN, nullptr);
    }

    s_in_run = false;
}

RETRO_API unsigned retro_get_region(void) { return RETRO_REGION_NTSC; }
RETRO_API void retro_set_controller_port_device(unsigned, unsigned) {}
RETRO_API size_t retro_serialize_size(void) { return 0; }
RETRO_API bool retro_serialize(void*, size_t) { return false; }
RETRO_API bool retro_unserialize(const void*, size_t) { return false; }
RETRO_API void retro_cheat_reset(void) {}
RETRO_API void retro_cheat_set(unsigned, bool, const char*) {}
RETRO_API void* retro_get_memory_data(unsigned) { return nullptr; }
RETRO_API size_t retro_get_memory_size(unsigned) { return 0; }

// =============================================================================
// Test controls
// =============================================================================

MOCK_EXPORT void mock_reset(void) {
    s_counters = MockCounters{};
    s_block_run = false;
    s_in_run = false;
    s_shutdown_on_init = false;
    s_shutdown_on_run = false;
    s_dupe_frames = false;
    s_hook = nullptr;
    s_hook_user_data = nullptr;
    s_query_before = 0;
    s_query_after = 0;
    s_system_dir.clear();
    s_save_dir.clear();
    s_assets_dir.clear();
    s_option_value.clear();
    s_batch_return = 0;
    s_framebuffer_seen = 0;
    s_hw_accepted = false;
    s_hw = retro_hw_render_callback{};
}

MOCK_EXPORT void mock_get_counters(struct MockCounters* out) {
    *out = s_counters;
}

MOCK_EXPORT void mock_set_block_run(int block) {
    s_block_run = block != 0;
}

MOCK_EXPORT int mock_is_in_run(void) {
    return s_in_run.load() ? 1 : 0;
}

MOCK_EXPORT void mock_set_shutdown_on_init(int enabled) {
    s_shutdown_on_init = enabled != 0;
}

MOCK_EXPORT void mock_set_shutdown_on_run(int enabled) {
    s_shutdown_on_run = enabled != 0;
}

MOCK_EXPORT void mock_set_dupe_frames(int enabled) {
    s_dupe_frames = enabled != 0;
}

MOCK_EXPORT void mock_set_mid_frame_hook(MockMidFrameHook hook, void* user_data) {
    s_hook = hook;
    s_hook_user_data = user_data;
}

MOCK_EXPORT void mock_get_input_queries(int16_t* before_hook, int16_t* after_hook) {
    *before_hook = s_query_before;
    *after_hook = s_query_after;
}

MOCK_EXPORT const char* mock_get_directory(unsigned cmd) {
    switch (cmd) {
        case RETRO_ENVIRONMENT_GET_SYSTEM_DIRECTORY:      return s_system_dir.c_str();
        case RETRO_ENVIRONMENT_GET_SAVE_DIRECTORY:        return s_save_dir.c_str();
        case RETRO_ENVIRONMENT_GET_CORE_ASSETS_DIRECTORY: return s_assets_dir.c_str();
        default:                                          return "";
    }
}

MOCK_EXPORT const char* mock_get_option_value(void) {
    return s_option_value.c_str();
}

MOCK_EXPORT size_t mock_get_batch_return(void) {
    return s_batch_return;
}

MOCK_EXPORT uintptr_t mock_get_framebuffer_seen(void) {
    return s_framebuffer_seen;
}

MOCK_EXPORT int mock_get_hw_accepted(void) {
    return s_hw_accepted ? 1 : 0;
}

MOCK_EXPORT int mock_call_environment(unsigned cmd, void* data) {
    return s_environment && s_environment(cmd, data) ? 1 : 0;
}
