#pragma once
#include "gw/platform/GamePlatform.hpp"

struct GLFWwindow;

namespace gw::platform {

/**
 * @brief Desktop platform on GLFW with an OpenGL 3.3 core context and an
 * SDL2_mixer audio device.
 */
class GlfwPlatform final : public GamePlatform {
public:
    GlfwPlatform() = default;
    ~GlfwPlatform() override;

    GlfwPlatform(const GlfwPlatform&) = delete;
    GlfwPlatform& operator=(const GlfwPlatform&) = delete;

    bool OpenWindow(const graphics::PresentationParameters& parameters,
                    const std::string& title) override;
    void CloseWindow() override;
    bool IsWindowOpen() const override { return m_window != nullptr; }

    void ApplyPresentation(const graphics::PresentationParameters& parameters) override;
    void SetWindowTitle(const std::string& title) override;
    void SetMouseVisible(bool visible) override;

    void PollEvents() override;
    bool ShouldClose() const override;
    void RequestClose() override;
    void Present() override;

    double GetTimeSeconds() const override;

    void AttachInput(input::InputSystem* inputSystem) override;

    std::unique_ptr<graphics::GraphicsDevice> CreateGraphicsDevice() override;
    std::unique_ptr<audio::AudioDevice> CreateAudioDevice() override;

private:
    static void ErrorCallback(int code, const char* description);
    static void KeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void MouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void CursorPosCallback(GLFWwindow* window, double x, double y);
    static void ScrollCallback(GLFWwindow* window, double xOffset, double yOffset);
    static void FocusCallback(GLFWwindow* window, int focused);

    static GlfwPlatform* FromWindow(GLFWwindow* window);

    GLFWwindow* m_window = nullptr;
    input::InputSystem* m_input = nullptr;
    bool m_glfwInitialized = false;
    bool m_fullScreen = false;
    int m_windowedX = 100;
    int m_windowedY = 100;
};

} // namespace gw::platform
