#include "input_state.hpp"

#include <libretro.h>
#include <algorithm>

namespace retrohost {

InputStateTable::InputStateTable() = default;

void InputStateTable::set_button(unsigned port, unsigned id, bool pressed) {
    if (port >= MAX_PORTS || id >= MAX_BUTTONS) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    uint16_t bit = static_cast<uint16_t>(1u << id);
    if (pressed) {
        m_live[port].buttons |= bit;
    } else {
        m_live[port].buttons &= static_cast<uint16_t>(~bit);
    }
}

void InputStateTable::set_buttons(unsigned port, uint16_t mask) {
    if (port >= MAX_PORTS) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_live[port].buttons = mask;
}

void InputStateTable::set_axis(unsigned port, unsigned stick, unsigned axis, float value) {
    if (port >= MAX_PORTS || stick >= ANALOG_STICKS || axis >= ANALOG_AXES) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    uint8_t bit = static_cast<uint8_t>(1u << (stick * ANALOG_AXES + axis));
    if (value > m_deadzone) {
        m_live[port].analog |= bit;
    } else {
        m_live[port].analog &= static_cast<uint8_t>(~bit);
    }
}

void InputStateTable::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_live.fill(PortState{});
}

void InputStateTable::set_deadzone(float deadzone) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_deadzone = std::clamp(deadzone, 0.0f, 1.0f);
}

float InputStateTable::get_deadzone() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deadzone;
}

void InputStateTable::begin_frame() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = m_live;
}

int16_t InputStateTable::query(unsigned port, unsigned device, unsigned index, unsigned id) const {
    if (port >= MAX_PORTS) return 0;

    const PortState& state = m_snapshot[port];

    switch (device) {
        case RETRO_DEVICE_JOYPAD:
            if (id >= MAX_BUTTONS) return 0;
            return (state.buttons >> id) & 1;

        case RETRO_DEVICE_ANALOG:
            if (index >= ANALOG_STICKS || id >= ANALOG_AXES) return 0;
            return (state.analog >> (index * ANALOG_AXES + id)) & 1;

        default:
            return 0;
    }
}

uint16_t InputStateTable::get_buttons(unsigned port) const {
    if (port >= MAX_PORTS) return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_live[port].buttons;
}

bool InputStateTable::is_axis_pressed(unsigned port, unsigned stick, unsigned axis) const {
    if (port >= MAX_PORTS || stick >= ANALOG_STICKS || axis >= ANALOG_AXES) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    return (m_live[port].analog >> (stick * ANALOG_AXES + axis)) & 1;
}

} // namespace retrohost
