#pragma once
#include <memory>
#include <string>

namespace gw {

namespace graphics {
class GraphicsDevice;
struct PresentationParameters;
}
namespace audio {
class AudioDevice;
}
namespace input {
class InputSystem;
}

namespace platform {

/**
 * @brief Host services the Core runs on: a window with a rendering context,
 * an event pump, a monotonic clock and device factories.
 *
 * GlfwPlatform is the production implementation; tests substitute a
 * headless one.
 */
class GamePlatform {
public:
    virtual ~GamePlatform() = default;

    // Creates the window and its rendering context. Returns false on failure.
    virtual bool OpenWindow(const graphics::PresentationParameters& parameters,
                            const std::string& title) = 0;
    virtual void CloseWindow() = 0;
    virtual bool IsWindowOpen() const = 0;

    // Resizes the back buffer and switches full-screen mode on an open window.
    virtual void ApplyPresentation(const graphics::PresentationParameters& parameters) = 0;
    virtual void SetWindowTitle(const std::string& title) = 0;
    virtual void SetMouseVisible(bool visible) = 0;

    virtual void PollEvents() = 0;
    virtual bool ShouldClose() const = 0;
    virtual void RequestClose() = 0;
    virtual void Present() = 0;

    // Monotonic seconds since an arbitrary epoch.
    virtual double GetTimeSeconds() const = 0;

    // Routes keyboard and mouse events into the given system until detached
    // with nullptr.
    virtual void AttachInput(input::InputSystem* inputSystem) = 0;

    // Valid only once the window is open.
    virtual std::unique_ptr<graphics::GraphicsDevice> CreateGraphicsDevice() = 0;
    virtual std::unique_ptr<audio::AudioDevice> CreateAudioDevice() = 0;
};

} // namespace platform
} // namespace gw
