#pragma once
#include <array>
#include <unordered_set>

#include <glm/vec2.hpp>

#include "gw/input/Keys.hpp"

namespace gw {
namespace input {

/**
 * @brief Backend-neutral keyboard and mouse state.
 *
 * The platform pushes raw events through the Handle* methods at any time.
 * Update() then takes a snapshot: the previous frame's state moves to
 * "previous" and the live state becomes "current". Queries only ever look at
 * the two snapshots, so every query inside one frame agrees.
 */
class InputSystem {
public:
    InputSystem() = default;

    // Event intake
    void HandleKey(Key key, bool pressed);
    void HandleMouseButton(MouseButton button, bool pressed);
    void HandleCursorPosition(double x, double y);
    void HandleScroll(double xOffset, double yOffset);
    // Drops every held key and button, e.g. when the window loses focus.
    void ReleaseAll();

    void Update();

    // Keyboard
    bool IsKeyDown(Key key) const;
    bool WasKeyDown(Key key) const;
    KeyState GetKeyState(Key key) const;

    // Mouse
    bool IsMouseButtonDown(MouseButton button) const;
    bool WasMouseButtonDown(MouseButton button) const;
    KeyState GetMouseButtonState(MouseButton button) const;
    glm::dvec2 GetMousePosition() const { return m_current.position; }
    glm::dvec2 GetMouseDelta() const { return m_current.position - m_previous.position; }
    glm::dvec2 GetScrollDelta() const { return m_current.scroll; }

private:
    struct Snapshot {
        std::unordered_set<int> keysDown;
        std::array<bool, static_cast<size_t>(MouseButton::Count)> buttons{};
        glm::dvec2 position{0.0};
        glm::dvec2 scroll{0.0};
    };

    static KeyState Classify(bool wasDown, bool isDown);
    static bool ValidButton(MouseButton button);

    Snapshot m_live;
    Snapshot m_current;
    Snapshot m_previous;
};

} // namespace input
} // namespace gw
