#pragma once
#include <glm/vec2.hpp>

#include "gw/core/GameTime.hpp"
#include "gw/input/InputSystem.hpp"

namespace gw {
namespace input {

class KeyboardInfo {
public:
    explicit KeyboardInfo(const InputSystem& system) : m_system(system) {}

    bool IsKeyDown(Key key) const { return m_system.IsKeyDown(key); }
    bool IsKeyUp(Key key) const { return !m_system.IsKeyDown(key); }
    bool WasKeyJustPressed(Key key) const { return m_system.GetKeyState(key) == KeyState::JustPressed; }
    bool WasKeyJustReleased(Key key) const { return m_system.GetKeyState(key) == KeyState::JustReleased; }

private:
    const InputSystem& m_system;
};

class MouseInfo {
public:
    explicit MouseInfo(const InputSystem& system) : m_system(system) {}

    glm::vec2 Position() const { return glm::vec2(m_system.GetMousePosition()); }
    glm::vec2 PositionDelta() const { return glm::vec2(m_system.GetMouseDelta()); }
    bool WasMoved() const { return m_system.GetMouseDelta() != glm::dvec2(0.0); }
    float ScrollWheelDelta() const { return static_cast<float>(m_system.GetScrollDelta().y); }

    bool IsButtonDown(MouseButton button) const { return m_system.IsMouseButtonDown(button); }
    bool IsButtonUp(MouseButton button) const { return !m_system.IsMouseButtonDown(button); }
    bool WasButtonJustPressed(MouseButton button) const {
        return m_system.GetMouseButtonState(button) == KeyState::JustPressed;
    }
    bool WasButtonJustReleased(MouseButton button) const {
        return m_system.GetMouseButtonState(button) == KeyState::JustReleased;
    }

private:
    const InputSystem& m_system;
};

/**
 * @brief Per-frame input snapshot owned by the Core.
 *
 * Update() is called once per update step before anything reads input.
 */
class InputManager {
public:
    InputManager()
        : m_keyboard(m_inputSystem),
          m_mouse(m_inputSystem) {}

    InputManager(const InputManager&) = delete;
    InputManager& operator=(const InputManager&) = delete;

    void Update(const core::GameTime& gameTime) {
        (void)gameTime;
        m_inputSystem.Update();
    }

    const KeyboardInfo& Keyboard() const { return m_keyboard; }
    const MouseInfo& Mouse() const { return m_mouse; }

    // Event intake for the platform layer.
    InputSystem& GetInputSystem() { return m_inputSystem; }

private:
    InputSystem m_inputSystem;
    KeyboardInfo m_keyboard;
    MouseInfo m_mouse;
};

} // namespace input
} // namespace gw
