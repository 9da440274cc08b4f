#include "gw/graphics/GraphicsDeviceManager.hpp"

#include <stdexcept>

#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"
#include "gw/platform/GamePlatform.hpp"

namespace gw::graphics {

GraphicsDeviceManager::GraphicsDeviceManager(platform::GamePlatform& platform)
    : m_platform(platform) {}

GraphicsDeviceManager::~GraphicsDeviceManager() = default;

void GraphicsDeviceManager::SetPreferredBackBufferWidth(int width) {
    if (width <= 0) {
        throw std::invalid_argument("Back buffer width must be positive");
    }
    m_preferred.backBufferWidth = width;
}

void GraphicsDeviceManager::SetPreferredBackBufferHeight(int height) {
    if (height <= 0) {
        throw std::invalid_argument("Back buffer height must be positive");
    }
    m_preferred.backBufferHeight = height;
}

void GraphicsDeviceManager::ApplyChanges() {
    m_applied = m_preferred;
    if (!m_device) {
        // Picked up by CreateDevice().
        return;
    }
    m_platform.ApplyPresentation(m_applied);
    m_device->SetViewport(Viewport{0, 0, m_applied.backBufferWidth, m_applied.backBufferHeight});
    core::Logger::Info("[GraphicsDeviceManager] Applied {}x{} ({})",
                       m_applied.backBufferWidth,
                       m_applied.backBufferHeight,
                       m_applied.isFullScreen ? "full screen" : "windowed");
}

void GraphicsDeviceManager::ToggleFullScreen() {
    m_preferred.isFullScreen = !m_preferred.isFullScreen;
    ApplyChanges();
}

void GraphicsDeviceManager::CreateDevice(const std::string& windowTitle) {
    if (m_device) {
        core::Logger::Warning("[GraphicsDeviceManager] Device already created");
        return;
    }

    m_applied = m_preferred;
    if (!m_platform.IsWindowOpen() && !m_platform.OpenWindow(m_applied, windowTitle)) {
        throw core::GraphicsError("device.create", "platform failed to open a window");
    }

    m_device = m_platform.CreateGraphicsDevice();
    if (!m_device) {
        throw core::GraphicsError("device.create", "platform returned no graphics device");
    }
    m_device->SetViewport(Viewport{0, 0, m_applied.backBufferWidth, m_applied.backBufferHeight});
    core::Logger::Info("[GraphicsDeviceManager] Created device with {}x{} back buffer",
                       m_applied.backBufferWidth, m_applied.backBufferHeight);
}

void GraphicsDeviceManager::DestroyDevice() {
    m_device.reset();
}

} // namespace gw::graphics
