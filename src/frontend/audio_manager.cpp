#include "audio_manager.hpp"

#include <SDL.h>
#include <algorithm>
#include <iostream>

namespace retrohost {

AudioManager::AudioManager() = default;

AudioManager::~AudioManager() {
    shutdown();
}

bool AudioManager::initialize(int sample_rate, int buffer_size) {
    SDL_AudioSpec desired{};
    desired.freq = sample_rate;
    desired.format = AUDIO_F32SYS;
    desired.channels = 2;
    desired.samples = static_cast<Uint16>(buffer_size);
    desired.callback = audio_callback;
    desired.userdata = this;

    // The device rate may differ from the request; batches are resampled to it
    SDL_AudioSpec obtained{};
    m_device_id = SDL_OpenAudioDevice(nullptr, 0, &desired, &obtained, SDL_AUDIO_ALLOW_FREQUENCY_CHANGE);
    if (m_device_id == 0) {
        std::cerr << "[Audio] Failed to open audio device: " << SDL_GetError() << std::endl;
        return false;
    }
    if (obtained.format != AUDIO_F32SYS || obtained.channels != 2) {
        std::cerr << "[Audio] Device refused stereo float output" << std::endl;
        SDL_CloseAudioDevice(m_device_id);
        m_device_id = 0;
        return false;
    }

    m_sample_rate = obtained.freq;
    m_buffer_size = obtained.samples;
    m_underrun_count = 0;
    m_overrun_count = 0;
    clear_buffer();
    m_paused = true;
    m_initialized = true;

    std::cout << "[Audio] Output " << m_sample_rate << " Hz, " << m_buffer_size
              << " frame device buffer" << std::endl;
    return true;
}

void AudioManager::shutdown() {
    if (!m_device_id) return;

    SDL_CloseAudioDevice(m_device_id);
    m_device_id = 0;
    m_initialized = false;

    uint64_t underruns = m_underrun_count.load(std::memory_order_relaxed);
    uint64_t overruns = m_overrun_count.load(std::memory_order_relaxed);
    if (underruns || overruns) {
        std::cout << "[Audio] " << underruns << " underrun(s), " << overruns << " dropped sample(s)" << std::endl;
    }
}

size_t AudioManager::distance(size_t read_pos, size_t write_pos) {
    return write_pos >= read_pos ? write_pos - read_pos : BUFFER_CAPACITY - read_pos + write_pos;
}

bool AudioManager::write_sample(size_t& write_pos, size_t read_pos, float value) {
    size_t next = (write_pos + 1) % BUFFER_CAPACITY;
    if (next == read_pos) {
        m_overrun_count.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    m_ring_buffer[write_pos] = value;
    write_pos = next;
    return true;
}

void AudioManager::push_samples(const float* samples, size_t count) {
    if (!m_initialized || !samples) return;

    size_t write_pos = m_write_pos.load(std::memory_order_relaxed);
    size_t read_pos = m_read_pos.load(std::memory_order_acquire);
    for (size_t i = 0; i < count; i++) {
        // Full: the rest of the batch is dropped
        if (!write_sample(write_pos, read_pos, samples[i])) break;
    }
    m_write_pos.store(write_pos, std::memory_order_release);
}

void AudioManager::push_samples_resampled(const float* samples, size_t count, double source_rate) {
    if (!m_initialized || !samples || count < 2 || source_rate <= 0.0) return;

    if (static_cast<int>(source_rate + 0.5) == m_sample_rate) {
        push_samples(samples, count);
        return;
    }

    const size_t frames = count / 2;
    const double step = source_rate / static_cast<double>(m_sample_rate);

    size_t write_pos = m_write_pos.load(std::memory_order_relaxed);
    size_t read_pos = m_read_pos.load(std::memory_order_acquire);

    // Linear interpolation between neighbouring stereo frames
    for (; m_resample_position < static_cast<double>(frames); m_resample_position += step) {
        size_t index = static_cast<size_t>(m_resample_position);
        size_t next = std::min(index + 1, frames - 1);
        float t = static_cast<float>(m_resample_position - static_cast<double>(index));

        const float* a = samples + index * 2;
        const float* b = samples + next * 2;
        if (!write_sample(write_pos, read_pos, a[0] + t * (b[0] - a[0])) ||
            !write_sample(write_pos, read_pos, a[1] + t * (b[1] - a[1]))) {
            m_resample_position = static_cast<double>(frames);
            break;
        }
    }

    // Fractional remainder carries into the next batch
    m_resample_position = std::max(0.0, m_resample_position - static_cast<double>(frames));
    m_write_pos.store(write_pos, std::memory_order_release);
}

void AudioManager::audio_callback(void* userdata, uint8_t* stream, int len) {
    auto* self = static_cast<AudioManager*>(userdata);
    self->fill_audio_buffer(reinterpret_cast<float*>(stream), static_cast<size_t>(len) / sizeof(float));
}

void AudioManager::fill_audio_buffer(float* buffer, size_t samples) {
    if (m_paused.load(std::memory_order_relaxed)) {
        std::fill(buffer, buffer + samples, 0.0f);
        return;
    }

    size_t read_pos = m_read_pos.load(std::memory_order_relaxed);
    size_t write_pos = m_write_pos.load(std::memory_order_acquire);
    bool underrun = false;

    for (size_t i = 0; i + 1 < samples; i += 2) {
        if (distance(read_pos, write_pos) >= 2) {
            m_last_sample_left = m_ring_buffer[read_pos];
            m_last_sample_right = m_ring_buffer[(read_pos + 1) % BUFFER_CAPACITY];
            read_pos = (read_pos + 2) % BUFFER_CAPACITY;
        } else {
            // Fade the held sample out instead of cutting to silence
            underrun = true;
            m_last_sample_left *= 0.95f;
            m_last_sample_right *= 0.95f;
        }
        buffer[i] = m_last_sample_left;
        buffer[i + 1] = m_last_sample_right;
    }

    if (underrun) {
        m_underrun_count.fetch_add(1, std::memory_order_relaxed);
    }
    m_read_pos.store(read_pos, std::memory_order_release);
}

void AudioManager::pause() {
    if (!m_device_id) return;
    SDL_PauseAudioDevice(m_device_id, 1);
    m_paused = true;
}

void AudioManager::resume() {
    if (!m_device_id) return;
    SDL_PauseAudioDevice(m_device_id, 0);
    m_paused = false;
}

void AudioManager::clear_buffer() {
    m_read_pos.store(0, std::memory_order_relaxed);
    m_write_pos.store(0, std::memory_order_relaxed);
    m_resample_position = 0.0;
    m_last_sample_left = 0.0f;
    m_last_sample_right = 0.0f;
}

bool AudioManager::is_buffer_ready() const {
    if (!m_initialized) return false;
    size_t queued = distance(m_read_pos.load(std::memory_order_acquire),
                             m_write_pos.load(std::memory_order_acquire));
    return queued >= static_cast<size_t>(m_buffer_size) * 2;
}

} // namespace retrohost
