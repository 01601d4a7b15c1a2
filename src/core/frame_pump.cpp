#include "frame_pump.hpp"


namespace retrohost {

FramePump::FramePump() = default;

FramePump::~FramePump() {
    invalidate();
}

void FramePump::arm(FrameCallback callback, double target_fps) {
    std::lock_guard<std::mutex> lock(m_tick_mutex);
    m_callback = std::move(callback);
    m_target_fps = target_fps > 0.0 ? target_fps : 60.0;
    m_frames_run = 0;
    m_frames_dropped = 0;
    m_armed.store(static_cast<bool>(m_callback), std::memory_order_release);
}

void FramePump::invalidate() {
    m_armed.store(false, std::memory_order_release);

    // Wait out a frame that is still running
    std::lock_guard<std::mutex> lock(m_tick_mutex);
    m_callback = nullptr;
}

FramePump::TickResult FramePump::tick() {
    if (!m_armed.load(std::memory_order_acquire)) {
        return TickResult::Inactive;
    }

    std::unique_lock<std::mutex> lock(m_tick_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        return TickResult::Dropped;
    }

    // Invalidated between the check above and taking the lock
    if (!m_armed.load(std::memory_order_acquire) || !m_callback) {
        return TickResult::Inactive;
    }

    if (!m_callback()) {
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        return TickResult::Dropped;
    }

    m_frames_run.fetch_add(1, std::memory_order_relaxed);
    return TickResult::Ran;
}

double FramePump::get_frame_interval_ms() const {
    return 1000.0 / m_target_fps;
}

} // namespace retrohost
