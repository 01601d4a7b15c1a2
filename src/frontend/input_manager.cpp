#include "input_manager.hpp"
#include "core/input_state.hpp"

#include <libretro.h>
#include <algorithm>
#include <iostream>

namespace retrohost {

InputManager::InputManager() = default;

InputManager::~InputManager() {
    shutdown();
}

bool InputManager::initialize(InputStateTable& table) {
    m_table = &table;

    // Controllers already attached; later ones arrive as SDL_CONTROLLERDEVICEADDED
    for (int i = 0; i < SDL_NumJoysticks(); i++) {
        if (SDL_IsGameController(i)) {
            open_controller(i);
        }
    }

    std::cout << "Input manager initialized: " << m_controllers.size() << " controller(s)" << std::endl;
    return true;
}

void InputManager::shutdown() {
    for (auto& controller : m_controllers) {
        if (controller.handle) {
            SDL_GameControllerClose(controller.handle);
        }
    }
    m_controllers.clear();
    m_table = nullptr;
}

void InputManager::open_controller(int device_index) {
    SDL_GameController* handle = SDL_GameControllerOpen(device_index);
    if (!handle) {
        std::cerr << "Failed to open game controller " << device_index << ": " << SDL_GetError() << std::endl;
        return;
    }

    SDL_JoystickID instance_id = SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(handle));
    if (find_controller(instance_id)) {
        SDL_GameControllerClose(handle);
        return;
    }

    // Lowest free port
    unsigned port = 0;
    while (std::any_of(m_controllers.begin(), m_controllers.end(),
                       [port](const Controller& c) { return c.port == port; })) {
        port++;
    }
    if (port >= InputStateTable::MAX_PORTS) {
        SDL_GameControllerClose(handle);
        return;
    }

    m_controllers.push_back({handle, instance_id, port});
    const char* name = SDL_GameControllerName(handle);
    std::cout << "Controller connected on port " << port << ": " << (name ? name : "Unknown") << std::endl;
}

void InputManager::close_controller(SDL_JoystickID instance_id) {
    auto it = std::find_if(m_controllers.begin(), m_controllers.end(),
                           [instance_id](const Controller& c) { return c.instance_id == instance_id; });
    if (it == m_controllers.end()) return;

    if (m_table) {
        m_table->set_buttons(it->port, 0);
        for (unsigned stick = 0; stick < InputStateTable::ANALOG_STICKS; stick++) {
            for (unsigned axis = 0; axis < InputStateTable::ANALOG_AXES; axis++) {
                m_table->set_axis(it->port, stick, axis, 0.0f);
            }
        }
    }

    std::cout << "Controller disconnected from port " << it->port << std::endl;
    SDL_GameControllerClose(it->handle);
    m_controllers.erase(it);
}

const InputManager::Controller* InputManager::find_controller(SDL_JoystickID instance_id) const {
    for (const auto& controller : m_controllers) {
        if (controller.instance_id == instance_id) {
            return &controller;
        }
    }
    return nullptr;
}

int InputManager::map_key(SDL_Keycode key) {
    switch (key) {
        case SDLK_x:      return RETRO_DEVICE_ID_JOYPAD_A;
        case SDLK_z:      return RETRO_DEVICE_ID_JOYPAD_B;
        case SDLK_s:      return RETRO_DEVICE_ID_JOYPAD_X;
        case SDLK_a:      return RETRO_DEVICE_ID_JOYPAD_Y;
        case SDLK_q:      return RETRO_DEVICE_ID_JOYPAD_L;
        case SDLK_w:      return RETRO_DEVICE_ID_JOYPAD_R;
        case SDLK_RETURN: return RETRO_DEVICE_ID_JOYPAD_START;
        case SDLK_RSHIFT: return RETRO_DEVICE_ID_JOYPAD_SELECT;
        case SDLK_UP:     return RETRO_DEVICE_ID_JOYPAD_UP;
        case SDLK_DOWN:   return RETRO_DEVICE_ID_JOYPAD_DOWN;
        case SDLK_LEFT:   return RETRO_DEVICE_ID_JOYPAD_LEFT;
        case SDLK_RIGHT:  return RETRO_DEVICE_ID_JOYPAD_RIGHT;
        default:          return -1;
    }
}

int InputManager::map_controller_button(Uint8 button) {
    // Face buttons map by position: the south button is the core's B
    switch (button) {
        case SDL_CONTROLLER_BUTTON_A:             return RETRO_DEVICE_ID_JOYPAD_B;
        case SDL_CONTROLLER_BUTTON_B:             return RETRO_DEVICE_ID_JOYPAD_A;
        case SDL_CONTROLLER_BUTTON_X:             return RETRO_DEVICE_ID_JOYPAD_Y;
        case SDL_CONTROLLER_BUTTON_Y:             return RETRO_DEVICE_ID_JOYPAD_X;
        case SDL_CONTROLLER_BUTTON_LEFTSHOULDER:  return RETRO_DEVICE_ID_JOYPAD_L;
        case SDL_CONTROLLER_BUTTON_RIGHTSHOULDER: return RETRO_DEVICE_ID_JOYPAD_R;
        case SDL_CONTROLLER_BUTTON_LEFTSTICK:     return RETRO_DEVICE_ID_JOYPAD_L3;
        case SDL_CONTROLLER_BUTTON_RIGHTSTICK:    return RETRO_DEVICE_ID_JOYPAD_R3;
        case SDL_CONTROLLER_BUTTON_START:         return RETRO_DEVICE_ID_JOYPAD_START;
        case SDL_CONTROLLER_BUTTON_BACK:          return RETRO_DEVICE_ID_JOYPAD_SELECT;
        case SDL_CONTROLLER_BUTTON_DPAD_UP:       return RETRO_DEVICE_ID_JOYPAD_UP;
        case SDL_CONTROLLER_BUTTON_DPAD_DOWN:     return RETRO_DEVICE_ID_JOYPAD_DOWN;
        case SDL_CONTROLLER_BUTTON_DPAD_LEFT:     return RETRO_DEVICE_ID_JOYPAD_LEFT;
        case SDL_CONTROLLER_BUTTON_DPAD_RIGHT:    return RETRO_DEVICE_ID_JOYPAD_RIGHT;
        default:                                  return -1;
    }
}

bool InputManager::process_event(const SDL_Event& event) {
    if (!m_table) return false;

    switch (event.type) {
        case SDL_KEYDOWN:
        case SDL_KEYUP: {
            if (event.key.repeat) return false;
            int id = map_key(event.key.keysym.sym);
            if (id < 0) return false;
            m_table->set_button(0, static_cast<unsigned>(id), event.type == SDL_KEYDOWN);
            return true;
        }

        case SDL_CONTROLLERBUTTONDOWN:
        case SDL_CONTROLLERBUTTONUP: {
            const Controller* controller = find_controller(event.cbutton.which);
            int id = map_controller_button(event.cbutton.button);
            if (!controller || id < 0) return false;
            m_table->set_button(controller->port, static_cast<unsigned>(id),
                                event.type == SDL_CONTROLLERBUTTONDOWN);
            return true;
        }

        case SDL_CONTROLLERAXISMOTION: {
            const Controller* controller = find_controller(event.caxis.which);
            if (!controller) return false;

            float value = static_cast<float>(event.caxis.value) / 32767.0f;
            switch (event.caxis.axis) {
                case SDL_CONTROLLER_AXIS_LEFTX:
                    m_table->set_axis(controller->port, RETRO_DEVICE_INDEX_ANALOG_LEFT, RETRO_DEVICE_ID_ANALOG_X, value);
                    return true;
                case SDL_CONTROLLER_AXIS_LEFTY:
                    m_table->set_axis(controller->port, RETRO_DEVICE_INDEX_ANALOG_LEFT, RETRO_DEVICE_ID_ANALOG_Y, value);
                    return true;
                case SDL_CONTROLLER_AXIS_RIGHTX:
                    m_table->set_axis(controller->port, RETRO_DEVICE_INDEX_ANALOG_RIGHT, RETRO_DEVICE_ID_ANALOG_X, value);
                    return true;
                case SDL_CONTROLLER_AXIS_RIGHTY:
                    m_table->set_axis(controller->port, RETRO_DEVICE_INDEX_ANALOG_RIGHT, RETRO_DEVICE_ID_ANALOG_Y, value);
                    return true;
                default:
                    return false;
            }
        }

        case SDL_CONTROLLERDEVICEADDED:
            open_controller(event.cdevice.which);
            return true;

        case SDL_CONTROLLERDEVICEREMOVED:
            close_controller(event.cdevice.which);
            return true;

        default:
            return false;
    }
}

} // namespace retrohost
