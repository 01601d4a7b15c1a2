#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace retrohost {

// SDL audio output fed from the core's converted float samples
// A lock-free single-producer ring buffer sits between the frame thread
// (push) and the SDL audio thread (pull).
class AudioManager {
public:
    AudioManager();
    ~AudioManager();

    // Disable copy
    AudioManager(const AudioManager&) = delete;
    AudioManager& operator=(const AudioManager&) = delete;

    bool initialize(int sample_rate = 48000, int buffer_size = 512);
    void shutdown();

    // Push interleaved stereo floats (count = individual samples)
    void push_samples(const float* samples, size_t count);

    // Push with linear-interpolation resampling from source_rate to the device rate
    void push_samples_resampled(const float* samples, size_t count, double source_rate);

    // Playback starts paused; resume once is_buffer_ready()
    void pause();
    void resume();

    // Drop queued audio and resampler state. Call while paused.
    void clear_buffer();

    // One device buffer of audio is queued
    bool is_buffer_ready() const;

private:
    static void audio_callback(void* userdata, uint8_t* stream, int len);
    void fill_audio_buffer(float* buffer, size_t samples);
    bool write_sample(size_t& write_pos, size_t read_pos, float value);

    // Individual samples between read_pos and write_pos
    static size_t distance(size_t read_pos, size_t write_pos);

    static constexpr size_t RING_BUFFER_SIZE = 8192;        // Stereo frames
    static constexpr size_t BUFFER_CAPACITY = RING_BUFFER_SIZE * 2;

    uint32_t m_device_id = 0;
    int m_sample_rate = 48000;
    int m_buffer_size = 512;
    bool m_initialized = false;

    float m_ring_buffer[BUFFER_CAPACITY] = {};
    std::atomic<size_t> m_read_pos{0};
    std::atomic<size_t> m_write_pos{0};
    std::atomic<bool> m_paused{true};

    // Resampler state
    double m_resample_position = 0.0;

    // Last output sample, faded toward zero on underrun
    float m_last_sample_left = 0.0f;
    float m_last_sample_right = 0.0f;

    std::atomic<uint64_t> m_underrun_count{0};
    std::atomic<uint64_t> m_overrun_count{0};
};

} // namespace retrohost
