#include "SampleGame.hpp"

#include <memory>

#include "TitleScene.hpp"
#include "gw/content/ContentManager.hpp"
#include "gw/core/Logger.hpp"
#include "gw/graphics/GraphicsDeviceManager.hpp"

SampleGame::SampleGame(const gw::utils::AppConfig& config)
    : gw::core::Core(config.window.title,
                     config.window.width,
                     config.window.height,
                     config.window.fullScreen) {
    SetExitOnEscape(config.game.exitOnEscape);
    SetMouseVisible(config.window.mouseVisible);

    Graphics().SetSynchronizeWithVerticalRetrace(config.window.vsync);
    Graphics().ApplyChanges();

    Clock().SetFixedTimeStep(config.game.fixedTimeStep);
    Clock().SetTargetElapsedSeconds(1.0 / config.game.targetFramesPerSecond);

    Content().SetRootDirectory(config.paths.content);
}

void SampleGame::LoadContent() {
    ChangeScene(std::make_shared<TitleScene>(*this));
}

void SampleGame::OnUpdate(const gw::core::GameTime& gameTime) {
    (void)gameTime;
    if (Input().Keyboard().WasKeyJustPressed(gw::input::Key::F11)) {
        Graphics().ToggleFullScreen();
    }
}

void SampleGame::OnUnloadContent() {
    gw::core::Logger::Info("[SampleGame] Unloading");
}
