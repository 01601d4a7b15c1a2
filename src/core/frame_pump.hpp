#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace retrohost {

// Drives one frame per display tick
//
// The pump never queues: a tick that arrives while the previous frame is
// still running is dropped and counted. invalidate() stops all future ticks
// and, once it returns, no frame callback is running.
class FramePump {
public:
    enum class TickResult {
        Ran,        // Frame callback executed
        Dropped,    // A frame was already in flight
        Inactive    // Pump not armed
    };

    // Returns false when the frame could not run (the pump treats it as dropped)
    using FrameCallback = std::function<bool()>;

    FramePump();
    ~FramePump();

    // Disable copy
    FramePump(const FramePump&) = delete;
    FramePump& operator=(const FramePump&) = delete;

    // Attach the per-frame callback and the target rate
    void arm(FrameCallback callback, double target_fps);

    // Stop future ticks and wait for an in-flight frame to finish
    // Must not be called from inside the frame callback.
    void invalidate();

    // Stop future ticks without waiting. Safe from inside the frame callback.
    void disarm() { m_armed.store(false, std::memory_order_release); }

    // Called by the display link or main loop
    TickResult tick();

    bool is_armed() const { return m_armed.load(std::memory_order_acquire); }
    double get_target_fps() const { return m_target_fps; }
    double get_frame_interval_ms() const;

    uint64_t get_frames_run() const { return m_frames_run.load(std::memory_order_relaxed); }
    uint64_t get_frames_dropped() const { return m_frames_dropped.load(std::memory_order_relaxed); }

private:
    std::mutex m_tick_mutex;    // Held for the duration of one frame
    FrameCallback m_callback;
    std::atomic<bool> m_armed{false};
    double m_target_fps = 60.0;

    std::atomic<uint64_t> m_frames_run{0};
    std::atomic<uint64_t> m_frames_dropped{0};
};

} // namespace retrohost
