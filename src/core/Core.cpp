#include "gw/core/Core.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "gw/audio/AudioController.hpp"
#include "gw/content/ContentManager.hpp"
#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"
#include "gw/graphics/GraphicsDeviceManager.hpp"
#include "gw/graphics/SpriteBatch.hpp"
#include "gw/platform/GamePlatform.hpp"
#include "gw/platform/GlfwPlatform.hpp"
#include "gw/scenes/Scene.hpp"

namespace gw::core {

Core* Core::s_instance = nullptr;

std::unique_ptr<platform::GamePlatform> Core::CheckConstruction(int width, int height,
                                                                std::unique_ptr<platform::GamePlatform> requested) {
    if (s_instance != nullptr) {
        throw InvalidOperationError("Only a single Core instance can be created");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Core back buffer size must be positive");
    }
    if (!requested) {
        return std::make_unique<platform::GlfwPlatform>();
    }
    return requested;
}

Core::Core(std::string title, int width, int height, bool fullScreen,
           std::unique_ptr<platform::GamePlatform> platform)
    : m_platform(CheckConstruction(width, height, std::move(platform))),
      m_graphics(std::make_unique<graphics::GraphicsDeviceManager>(*m_platform)),
      m_services(std::make_shared<content::ContentServices>()),
      m_content(std::make_unique<content::ContentManager>(content::ContentManager::kDefaultRootDirectory,
                                                          m_services)),
      m_title(std::move(title)) {
    m_graphics->SetPreferredBackBufferWidth(width);
    m_graphics->SetPreferredBackBufferHeight(height);
    m_graphics->SetIsFullScreen(fullScreen);
    m_graphics->ApplyChanges();

    s_instance = this;
    Logger::Debug("[Core] Created '{}' ({}x{}{})", m_title, width, height, fullScreen ? ", full screen" : "");
}

Core::~Core() {
    // Scenes release their content while every device is still alive.
    m_pendingScene.reset();
    if (m_activeScene) {
        try {
            m_activeScene->Dispose();
        } catch (const std::exception& ex) {
            Logger::Error("[Core] Disposing scene '{}' failed: {}", m_activeScene->GetName(), ex.what());
        }
        m_activeScene.reset();
    }
    if (m_initialized) {
        m_platform->AttachInput(nullptr);
    }
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

Core* Core::Instance() {
    return s_instance;
}

void Core::Initialize() {
    if (m_initialized) {
        Logger::Warning("[Core] Initialize called twice; ignoring");
        return;
    }

    m_platform->AttachInput(&m_input.GetInputSystem());
    m_graphics->CreateDevice(m_title);
    m_platform->SetMouseVisible(m_mouseVisible);

    m_audio = std::make_unique<audio::AudioController>(m_platform->CreateAudioDevice());
    m_spriteBatch = std::make_unique<graphics::SpriteBatch>(*m_graphics->GetGraphicsDevice());

    m_services->graphicsDevice = m_graphics->GetGraphicsDevice();
    m_services->audioDevice = m_audio->GetDevice();

    m_clock.Reset();
    m_lastTickSeconds = m_platform->GetTimeSeconds();
    m_initialized = true;

    const auto& applied = m_graphics->Applied();
    Logger::Info("[Core] Initialized '{}' at {}x{}", m_title, applied.backBufferWidth, applied.backBufferHeight);

    LoadContent();
}

void Core::Update(const GameTime& gameTime) {
    RequireInitialized("Update");

    m_input.Update(gameTime);
    m_audio->Update();

    if (m_exitOnEscape && m_input.Keyboard().IsKeyDown(input::Key::Escape)) {
        Exit();
    }

    if (m_pendingScene) {
        TransitionScene();
    }

    if (m_activeScene) {
        m_activeScene->Update(gameTime);
    }

    OnUpdate(gameTime);
}

void Core::Draw(const GameTime& gameTime) {
    if (m_activeScene) {
        m_activeScene->Draw(gameTime);
    }
    OnDraw(gameTime);
}

void Core::UnloadContent() {
    if (m_audio) {
        m_audio->Dispose();
    }
    OnUnloadContent();
}

void Core::ChangeScene(std::shared_ptr<scenes::Scene> next) {
    if (next && next == m_activeScene) {
        return;
    }
    if (!next && m_pendingScene) {
        Logger::Debug("[Core] Pending scene '{}' cancelled", m_pendingScene->GetName());
    }
    m_pendingScene = std::move(next);
}

void Core::TransitionScene() {
    const std::string outgoing = m_activeScene ? m_activeScene->GetName() : std::string("<none>");
    const std::string incoming = m_pendingScene ? m_pendingScene->GetName() : std::string("<none>");

    if (m_activeScene) {
        m_activeScene->Dispose();
    }
    // Dropping the last reference runs the outgoing scene's destructors, so
    // its GPU and audio resources are gone before the next scene loads.
    m_activeScene.reset();

    m_activeScene = std::move(m_pendingScene);
    m_pendingScene.reset();

    Logger::Info("[Core] Scene transition: '{}' -> '{}'", outgoing, incoming);

    if (m_activeScene) {
        m_activeScene->Initialize();
    }
}

int Core::Run() {
    Initialize();
    while (!m_exitRequested && !m_platform->ShouldClose()) {
        Tick();
    }
    UnloadContent();
    Logger::Info("[Core] '{}' exited", m_title);
    return EXIT_SUCCESS;
}

void Core::Tick() {
    RequireInitialized("Tick");

    m_platform->PollEvents();

    const double now = m_platform->GetTimeSeconds();
    const double elapsed = now - m_lastTickSeconds;
    m_lastTickSeconds = now;

    const int steps = m_clock.Accumulate(elapsed);
    if (steps == 0) {
        const double wait = m_clock.SecondsUntilNextStep();
        if (wait > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(wait));
        }
        return;
    }

    for (int i = 0; i < steps; ++i) {
        Update(m_clock.ConsumeStep());
        if (m_exitRequested) {
            break;
        }
    }

    Draw(m_clock.CurrentTime());
    m_platform->Present();
}

void Core::Exit() {
    m_exitRequested = true;
    m_platform->RequestClose();
}

graphics::GraphicsDevice& Core::GraphicsDevice() const {
    RequireInitialized("GraphicsDevice");
    return *m_graphics->GetGraphicsDevice();
}

graphics::SpriteBatch& Core::SpriteBatch() const {
    RequireInitialized("SpriteBatch");
    return *m_spriteBatch;
}

audio::AudioController& Core::Audio() const {
    RequireInitialized("Audio");
    return *m_audio;
}

void Core::SetMouseVisible(bool visible) {
    m_mouseVisible = visible;
    if (m_platform->IsWindowOpen()) {
        m_platform->SetMouseVisible(visible);
    }
}

void Core::SetTitle(std::string title) {
    m_title = std::move(title);
    if (m_platform->IsWindowOpen()) {
        m_platform->SetWindowTitle(m_title);
    }
}

void Core::RequireInitialized(const char* operation) const {
    if (!m_initialized) {
        throw InvalidOperationError(std::string("Core::") + operation + " called before Initialize");
    }
}

} // namespace gw::core
