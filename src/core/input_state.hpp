#pragma once

#include <array>
#include <cstdint>
#include <mutex>

namespace retrohost {

// Host-side controller state queried by the core's input_state callback
//
// Writers (event thread, tests) update the live table under a mutex.
// At the start of each frame the frame thread copies the live table into
// a snapshot; every query during that frame reads the snapshot, so a write
// landing mid-frame is only visible on the next frame.
class InputStateTable {
public:
    static constexpr unsigned MAX_PORTS = 8;
    static constexpr unsigned MAX_BUTTONS = 16;      // RETRO_DEVICE_ID_JOYPAD_B..R3
    static constexpr unsigned ANALOG_STICKS = 2;     // Left, right
    static constexpr unsigned ANALOG_AXES = 2;       // X, Y
    static constexpr float DEFAULT_DEADZONE = 0.2f;

    InputStateTable();

    // Set a single joypad button
    void set_button(unsigned port, unsigned id, bool pressed);

    // Replace all joypad buttons of a port in one atomic update
    // Bit N of mask is RETRO_DEVICE_ID_JOYPAD id N.
    void set_buttons(unsigned port, uint16_t mask);

    // Record an analog axis value in [-1, 1]
    // The axis counts as pressed only when value > deadzone.
    void set_axis(unsigned port, unsigned stick, unsigned axis, float value);

    // Release everything on every port
    void clear();

    void set_deadzone(float deadzone);
    float get_deadzone() const;

    // Copy live state into the frame snapshot
    void begin_frame();

    // Answer an input_state query from the frame snapshot
    // Returns 0 or 1; unknown devices, ports or ids return 0.
    int16_t query(unsigned port, unsigned device, unsigned index, unsigned id) const;

    // Live (not snapshot) state, for the host UI and tests
    uint16_t get_buttons(unsigned port) const;
    bool is_axis_pressed(unsigned port, unsigned stick, unsigned axis) const;

private:
    struct PortState {
        uint16_t buttons = 0;
        uint8_t analog = 0;     // Bit (stick * ANALOG_AXES + axis)
    };

    using Table = std::array<PortState, MAX_PORTS>;

    mutable std::mutex m_mutex;
    Table m_live{};
    Table m_snapshot{};     // Only touched by the frame thread
    float m_deadzone = DEFAULT_DEADZONE;
};

} // namespace retrohost
