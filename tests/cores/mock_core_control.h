#pragma once

// Test-only exports of the mock libretro core
// Tests open the same module the bridge loads and drive it through these.

#include <stddef.h>
#include <stdint.h>

#define MOCK_FRAME_WIDTH 32
#define MOCK_FRAME_HEIGHT 16
#define MOCK_FRAME_PITCH 160        // 40 pixels per row, 8 of them padding
#define MOCK_AUDIO_BATCH_FRAMES 4

struct MockCounters {
    int init;
    int deinit;
    int run;
    int load_game;
    int unload_game;
    int reset;
    int context_reset;
    int context_destroy;
};

// Called between the two input queries inside retro_run
typedef void (*MockMidFrameHook)(void* user_data);

#ifdef __cplusplus
extern "C" {
#endif

typedef void (*mock_reset_t)(void);
typedef void (*mock_get_counters_t)(struct MockCounters* out);
typedef void (*mock_set_block_run_t)(int block);
typedef int (*mock_is_in_run_t)(void);
typedef void (*mock_set_shutdown_on_init_t)(int enabled);
typedef void (*mock_set_shutdown_on_run_t)(int enabled);
typedef void (*mock_set_dupe_frames_t)(int enabled);
typedef void (*mock_set_mid_frame_hook_t)(MockMidFrameHook hook, void* user_data);
typedef void (*mock_get_input_queries_t)(int16_t* before_hook, int16_t* after_hook);
typedef const char* (*mock_get_directory_t)(unsigned cmd);
typedef const char* (*mock_get_option_value_t)(void);
typedef size_t (*mock_get_batch_return_t)(void);
typedef uintptr_t (*mock_get_framebuffer_seen_t)(void);
typedef int (*mock_get_hw_accepted_t)(void);
typedef int (*mock_call_environment_t)(unsigned cmd, void* data);

#ifdef __cplusplus
}
#endif
