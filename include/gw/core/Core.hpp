#pragma once
#include <memory>
#include <string>

#include "gw/core/GameClock.hpp"
#include "gw/core/GameTime.hpp"
#include "gw/input/InputManager.hpp"

namespace gw {

namespace graphics {
class GraphicsDevice;
class GraphicsDeviceManager;
class SpriteBatch;
}
namespace content {
class ContentManager;
struct ContentServices;
}
namespace audio {
class AudioController;
}
namespace platform {
class GamePlatform;
}
namespace scenes {
class Scene;
}

namespace core {

/**
 * @brief Application context for a 2D game.
 *
 * Owns the platform window, graphics device, sprite batch, content, input and
 * audio, and runs one active Scene. Scene changes requested with
 * ChangeScene() are applied at the start of the next Update, so a scene is
 * never disposed while it is running.
 *
 * Only one Core may exist at a time. Collaborators receive it by reference;
 * Instance() exists for code that cannot be handed one.
 */
class Core {
public:
    // Throws InvalidOperationError if another Core is alive and
    // std::invalid_argument for a non-positive size. A null platform selects
    // the GLFW platform.
    Core(std::string title, int width, int height, bool fullScreen,
         std::unique_ptr<platform::GamePlatform> platform = nullptr);
    virtual ~Core();

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    static Core* Instance();

    // Opens the window, creates the devices and calls LoadContent().
    void Initialize();
    // Input, audio, escape-to-exit, pending scene switch, active scene.
    // Throws InvalidOperationError before Initialize().
    void Update(const GameTime& gameTime);
    void Draw(const GameTime& gameTime);
    // Disposes the audio controller. The active scene stays alive.
    void UnloadContent();

    // Queues a scene to replace the active one at the next Update. Requesting
    // the active scene is ignored; the latest other request wins. Passing
    // nullptr cancels the pending request.
    void ChangeScene(std::shared_ptr<scenes::Scene> next);

    // Initialize, Tick until exit, UnloadContent.
    int Run();
    // Polls events and runs the update steps that are due, then draws once.
    void Tick();
    void Exit();

    graphics::GraphicsDeviceManager& Graphics() { return *m_graphics; }
    graphics::GraphicsDevice& GraphicsDevice() const;
    graphics::SpriteBatch& SpriteBatch() const;
    content::ContentManager& Content() const { return *m_content; }
    input::InputManager& Input() { return m_input; }
    const input::InputManager& Input() const { return m_input; }
    audio::AudioController& Audio() const;
    platform::GamePlatform& Platform() const { return *m_platform; }
    GameClock& Clock() { return m_clock; }

    bool ExitOnEscape() const { return m_exitOnEscape; }
    void SetExitOnEscape(bool enabled) { m_exitOnEscape = enabled; }
    bool IsMouseVisible() const { return m_mouseVisible; }
    void SetMouseVisible(bool visible);
    const std::string& Title() const { return m_title; }
    void SetTitle(std::string title);

    const std::shared_ptr<scenes::Scene>& ActiveScene() const { return m_activeScene; }
    const std::shared_ptr<scenes::Scene>& PendingScene() const { return m_pendingScene; }
    bool IsInitialized() const { return m_initialized; }
    bool IsExitRequested() const { return m_exitRequested; }

protected:
    // Called at the end of Initialize(), once every device exists.
    virtual void LoadContent() {}
    virtual void OnUpdate(const GameTime& gameTime) { (void)gameTime; }
    virtual void OnDraw(const GameTime& gameTime) { (void)gameTime; }
    virtual void OnUnloadContent() {}

private:
    // Runs in the first member initializer, so a rejected Core builds nothing.
    static std::unique_ptr<platform::GamePlatform> CheckConstruction(
        int width, int height, std::unique_ptr<platform::GamePlatform> requested);

    void TransitionScene();
    void RequireInitialized(const char* operation) const;

    static Core* s_instance;

    // Declaration order is teardown order in reverse: scenes go first, the
    // platform window last.
    std::unique_ptr<platform::GamePlatform> m_platform;
    std::unique_ptr<graphics::GraphicsDeviceManager> m_graphics;
    std::unique_ptr<audio::AudioController> m_audio;
    std::unique_ptr<graphics::SpriteBatch> m_spriteBatch;
    std::shared_ptr<content::ContentServices> m_services;
    std::unique_ptr<content::ContentManager> m_content;
    input::InputManager m_input;
    GameClock m_clock;

    std::string m_title;
    bool m_exitOnEscape = true;
    bool m_mouseVisible = true;
    bool m_initialized = false;
    bool m_exitRequested = false;
    double m_lastTickSeconds = 0.0;

    std::shared_ptr<scenes::Scene> m_activeScene;
    std::shared_ptr<scenes::Scene> m_pendingScene;
};

} // namespace core
} // namespace gw
