#pragma once

#include <SDL.h>
#include <vector>

namespace retrohost {

class InputStateTable;

// Translates SDL keyboard and game controller events into the input table
// Keyboard and the first controller drive port 0, further controllers
// take the following ports.
class InputManager {
public:
    InputManager();
    ~InputManager();

    // Disable copy
    InputManager(const InputManager&) = delete;
    InputManager& operator=(const InputManager&) = delete;

    bool initialize(InputStateTable& table);
    void shutdown();

    // Feed one SDL event. Returns true if it changed input state.
    bool process_event(const SDL_Event& event);

private:
    struct Controller {
        SDL_GameController* handle = nullptr;
        SDL_JoystickID instance_id = -1;
        unsigned port = 0;
    };

    void open_controller(int device_index);
    void close_controller(SDL_JoystickID instance_id);
    const Controller* find_controller(SDL_JoystickID instance_id) const;

    // RETRO_DEVICE_ID_JOYPAD id for a key or button, -1 if unmapped
    static int map_key(SDL_Keycode key);
    static int map_controller_button(Uint8 button);

    InputStateTable* m_table = nullptr;
    std::vector<Controller> m_controllers;
};

} // namespace retrohost
