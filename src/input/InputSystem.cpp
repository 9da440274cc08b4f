#include "gw/input/InputSystem.hpp"

#include <utility>

namespace gw {
namespace input {

void InputSystem::HandleKey(Key key, bool pressed) {
    if (key == Key::Unknown) {
        return;
    }
    if (pressed) {
        m_live.keysDown.insert(static_cast<int>(key));
    } else {
        m_live.keysDown.erase(static_cast<int>(key));
    }
}

void InputSystem::HandleMouseButton(MouseButton button, bool pressed) {
    if (!ValidButton(button)) return;
    m_live.buttons[static_cast<size_t>(button)] = pressed;
}

void InputSystem::HandleCursorPosition(double x, double y) {
    m_live.position = glm::dvec2(x, y);
}

void InputSystem::HandleScroll(double xOffset, double yOffset) {
    m_live.scroll += glm::dvec2(xOffset, yOffset);
}

void InputSystem::ReleaseAll() {
    m_live.keysDown.clear();
    m_live.buttons.fill(false);
}

void InputSystem::Update() {
    m_previous = std::move(m_current);
    m_current = m_live;

    // Scroll is a per-frame delta, the rest is level state.
    m_live.scroll = glm::dvec2(0.0);
}

bool InputSystem::IsKeyDown(Key key) const {
    return m_current.keysDown.count(static_cast<int>(key)) != 0;
}

bool InputSystem::WasKeyDown(Key key) const {
    return m_previous.keysDown.count(static_cast<int>(key)) != 0;
}

KeyState InputSystem::GetKeyState(Key key) const {
    return Classify(WasKeyDown(key), IsKeyDown(key));
}

bool InputSystem::IsMouseButtonDown(MouseButton button) const {
    return ValidButton(button) && m_current.buttons[static_cast<size_t>(button)];
}

bool InputSystem::WasMouseButtonDown(MouseButton button) const {
    return ValidButton(button) && m_previous.buttons[static_cast<size_t>(button)];
}

KeyState InputSystem::GetMouseButtonState(MouseButton button) const {
    return Classify(WasMouseButtonDown(button), IsMouseButtonDown(button));
}

KeyState InputSystem::Classify(bool wasDown, bool isDown) {
    if (isDown) {
        return wasDown ? KeyState::Held : KeyState::JustPressed;
    }
    return wasDown ? KeyState::JustReleased : KeyState::Released;
}

bool InputSystem::ValidButton(MouseButton button) {
    const int idx = static_cast<int>(button);
    return idx >= 0 && idx < static_cast<int>(MouseButton::Count);
}

} // namespace input
} // namespace gw
