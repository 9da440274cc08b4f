#include "gw/platform/GlfwPlatform.hpp"

#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "gw/audio/SdlMixerAudioDevice.hpp"
#include "gw/core/Logger.hpp"
#include "gw/graphics/GraphicsDeviceManager.hpp"
#include "gw/graphics/OpenGLGraphicsDevice.hpp"
#include "gw/input/InputSystem.hpp"

namespace gw::platform {

static_assert(static_cast<int>(input::Key::Escape) == GLFW_KEY_ESCAPE, "Key codes must match GLFW");
static_assert(static_cast<int>(input::Key::A) == GLFW_KEY_A, "Key codes must match GLFW");
static_assert(static_cast<int>(input::Key::Up) == GLFW_KEY_UP, "Key codes must match GLFW");
static_assert(static_cast<int>(input::Key::RightAlt) == GLFW_KEY_RIGHT_ALT, "Key codes must match GLFW");
static_assert(static_cast<int>(input::MouseButton::Middle) == GLFW_MOUSE_BUTTON_MIDDLE,
              "Mouse buttons must match GLFW");

GlfwPlatform::~GlfwPlatform() {
    CloseWindow();
}

bool GlfwPlatform::OpenWindow(const graphics::PresentationParameters& parameters,
                              const std::string& title) {
    if (m_window) {
        return true;
    }

    glfwSetErrorCallback(ErrorCallback);
    if (!m_glfwInitialized) {
        if (!glfwInit()) {
            core::Logger::Error("[GlfwPlatform] Failed to initialize GLFW");
            return false;
        }
        m_glfwInitialized = true;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    GLFWmonitor* monitor = parameters.isFullScreen ? glfwGetPrimaryMonitor() : nullptr;
    m_window = glfwCreateWindow(parameters.backBufferWidth,
                                parameters.backBufferHeight,
                                title.c_str(),
                                monitor,
                                nullptr);
    if (!m_window) {
        core::Logger::Error("[GlfwPlatform] Failed to create GLFW window");
        glfwTerminate();
        m_glfwInitialized = false;
        return false;
    }
    m_fullScreen = monitor != nullptr;

    glfwMakeContextCurrent(m_window);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        core::Logger::Error("[GlfwPlatform] Failed to initialize GLAD");
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
        m_glfwInitialized = false;
        return false;
    }

    glfwSetWindowUserPointer(m_window, this);
    glfwSetKeyCallback(m_window, KeyCallback);
    glfwSetMouseButtonCallback(m_window, MouseButtonCallback);
    glfwSetCursorPosCallback(m_window, CursorPosCallback);
    glfwSetScrollCallback(m_window, ScrollCallback);
    glfwSetWindowFocusCallback(m_window, FocusCallback);

    glfwSwapInterval(parameters.synchronizeWithVerticalRetrace ? 1 : 0);

    core::Logger::Info("[GlfwPlatform] Window opened: {}x{}{} (OpenGL {})",
                       parameters.backBufferWidth, parameters.backBufferHeight,
                       m_fullScreen ? " full screen" : "",
                       reinterpret_cast<const char*>(glGetString(GL_VERSION)));
    return true;
}

void GlfwPlatform::CloseWindow() {
    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_glfwInitialized) {
        glfwTerminate();
        m_glfwInitialized = false;
    }
}

void GlfwPlatform::ApplyPresentation(const graphics::PresentationParameters& parameters) {
    if (!m_window) {
        return;
    }

    if (parameters.isFullScreen && !m_fullScreen) {
        glfwGetWindowPos(m_window, &m_windowedX, &m_windowedY);
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        glfwSetWindowMonitor(m_window, monitor, 0, 0,
                             parameters.backBufferWidth, parameters.backBufferHeight,
                             GLFW_DONT_CARE);
        m_fullScreen = true;
    } else if (!parameters.isFullScreen && m_fullScreen) {
        glfwSetWindowMonitor(m_window, nullptr, m_windowedX, m_windowedY,
                             parameters.backBufferWidth, parameters.backBufferHeight,
                             GLFW_DONT_CARE);
        m_fullScreen = false;
    } else {
        glfwSetWindowSize(m_window, parameters.backBufferWidth, parameters.backBufferHeight);
    }

    glfwSwapInterval(parameters.synchronizeWithVerticalRetrace ? 1 : 0);
}

void GlfwPlatform::SetWindowTitle(const std::string& title) {
    if (m_window) {
        glfwSetWindowTitle(m_window, title.c_str());
    }
}

void GlfwPlatform::SetMouseVisible(bool visible) {
    if (m_window) {
        glfwSetInputMode(m_window, GLFW_CURSOR, visible ? GLFW_CURSOR_NORMAL : GLFW_CURSOR_HIDDEN);
    }
}

void GlfwPlatform::PollEvents() {
    if (m_glfwInitialized) {
        glfwPollEvents();
    }
}

bool GlfwPlatform::ShouldClose() const {
    return !m_window || glfwWindowShouldClose(m_window);
}

void GlfwPlatform::RequestClose() {
    if (m_window) {
        glfwSetWindowShouldClose(m_window, GLFW_TRUE);
    }
}

void GlfwPlatform::Present() {
    if (m_window) {
        glfwSwapBuffers(m_window);
    }
}

double GlfwPlatform::GetTimeSeconds() const {
    return m_glfwInitialized ? glfwGetTime() : 0.0;
}

void GlfwPlatform::AttachInput(input::InputSystem* inputSystem) {
    m_input = inputSystem;
}

std::unique_ptr<graphics::GraphicsDevice> GlfwPlatform::CreateGraphicsDevice() {
    if (!m_window) {
        core::Logger::Error("[GlfwPlatform] CreateGraphicsDevice called without a window");
        return nullptr;
    }
    return std::make_unique<graphics::OpenGLGraphicsDevice>();
}

std::unique_ptr<audio::AudioDevice> GlfwPlatform::CreateAudioDevice() {
    return std::make_unique<audio::SdlMixerAudioDevice>();
}

void GlfwPlatform::ErrorCallback(int code, const char* description) {
    core::Logger::Error("[GlfwPlatform] GLFW error {}: {}", code, description ? description : "unknown");
}

GlfwPlatform* GlfwPlatform::FromWindow(GLFWwindow* window) {
    return static_cast<GlfwPlatform*>(glfwGetWindowUserPointer(window));
}

void GlfwPlatform::KeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    auto* self = FromWindow(window);
    if (!self || !self->m_input || action == GLFW_REPEAT) {
        return;
    }
    self->m_input->HandleKey(static_cast<input::Key>(key), action == GLFW_PRESS);
}

void GlfwPlatform::MouseButtonCallback(GLFWwindow* window, int button, int action, int mods) {
    (void)mods;
    auto* self = FromWindow(window);
    if (!self || !self->m_input) {
        return;
    }
    self->m_input->HandleMouseButton(static_cast<input::MouseButton>(button), action == GLFW_PRESS);
}

void GlfwPlatform::CursorPosCallback(GLFWwindow* window, double x, double y) {
    auto* self = FromWindow(window);
    if (self && self->m_input) {
        self->m_input->HandleCursorPosition(x, y);
    }
}

void GlfwPlatform::ScrollCallback(GLFWwindow* window, double xOffset, double yOffset) {
    auto* self = FromWindow(window);
    if (self && self->m_input) {
        self->m_input->HandleScroll(xOffset, yOffset);
    }
}

void GlfwPlatform::FocusCallback(GLFWwindow* window, int focused) {
    auto* self = FromWindow(window);
    if (self && self->m_input && !focused) {
        self->m_input->ReleaseAll();
    }
}

} // namespace gw::platform
