#pragma once
#include <memory>
#include <string>

#include "gw/graphics/GraphicsDevice.hpp"

namespace gw {

namespace platform {
class GamePlatform;
}

namespace graphics {

struct PresentationParameters {
    int backBufferWidth = 800;
    int backBufferHeight = 480;
    bool isFullScreen = false;
    bool synchronizeWithVerticalRetrace = true;
};

/**
 * @brief Holds the preferred presentation settings and owns the GraphicsDevice
 * once the platform window exists.
 *
 * Setters only record preferences; ApplyChanges() pushes them to the window.
 */
class GraphicsDeviceManager {
public:
    explicit GraphicsDeviceManager(platform::GamePlatform& platform);
    ~GraphicsDeviceManager();

    GraphicsDeviceManager(const GraphicsDeviceManager&) = delete;
    GraphicsDeviceManager& operator=(const GraphicsDeviceManager&) = delete;

    // Throws std::invalid_argument for non-positive sizes.
    void SetPreferredBackBufferWidth(int width);
    void SetPreferredBackBufferHeight(int height);
    void SetIsFullScreen(bool fullScreen) { m_preferred.isFullScreen = fullScreen; }
    void SetSynchronizeWithVerticalRetrace(bool enabled) { m_preferred.synchronizeWithVerticalRetrace = enabled; }

    int PreferredBackBufferWidth() const { return m_preferred.backBufferWidth; }
    int PreferredBackBufferHeight() const { return m_preferred.backBufferHeight; }
    bool IsFullScreen() const { return m_preferred.isFullScreen; }
    bool SynchronizeWithVerticalRetrace() const { return m_preferred.synchronizeWithVerticalRetrace; }

    const PresentationParameters& Applied() const { return m_applied; }

    void ApplyChanges();
    void ToggleFullScreen();

    // Opens the platform window and creates the device. Throws GraphicsError.
    void CreateDevice(const std::string& windowTitle);
    void DestroyDevice();
    bool IsDeviceCreated() const { return m_device != nullptr; }

    // Null until CreateDevice() succeeds.
    GraphicsDevice* GetGraphicsDevice() const { return m_device.get(); }

private:
    platform::GamePlatform& m_platform;
    PresentationParameters m_preferred;
    PresentationParameters m_applied;
    std::unique_ptr<GraphicsDevice> m_device;
};

} // namespace graphics
} // namespace gw
