#include "PlayScene.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "TitleScene.hpp"
#include "gw/audio/AudioController.hpp"
#include "gw/audio/SoundEffect.hpp"
#include "gw/content/ContentManager.hpp"
#include "gw/core/Core.hpp"
#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"
#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/SpriteBatch.hpp"
#include "gw/graphics/Texture2D.hpp"

namespace {

std::shared_ptr<gw::graphics::Texture2D> MakeCheckerboard(gw::graphics::GraphicsDevice& device) {
    constexpr int kSize = 64;
    constexpr int kCell = 8;
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(kSize * kSize * 4));
    for (int y = 0; y < kSize; ++y) {
        for (int x = 0; x < kSize; ++x) {
            const bool dark = ((x / kCell) + (y / kCell)) % 2 == 0;
            const std::uint8_t shade = dark ? 40 : 56;
            const std::size_t i = static_cast<std::size_t>((y * kSize + x) * 4);
            pixels[i + 0] = shade;
            pixels[i + 1] = shade;
            pixels[i + 2] = static_cast<std::uint8_t>(shade + 16);
            pixels[i + 3] = 255;
        }
    }
    return gw::graphics::Texture2D::FromPixels(device, kSize, kSize, pixels);
}

} // namespace

PlayScene::PlayScene(gw::core::Core& core)
    : gw::scenes::Scene(core, "Play") {}

void PlayScene::LoadContent() {
    auto& device = GetCore().GraphicsDevice();
    m_background = MakeCheckerboard(device);
    m_player = gw::graphics::Texture2D::MakeSolid(device, kPlayerSize, kPlayerSize,
                                                  gw::graphics::Color::Yellow);

    try {
        m_blip = Content().Load<gw::audio::SoundEffect>("blip");
    } catch (const gw::core::ContentLoadError& e) {
        gw::core::Logger::Warning("[PlayScene] Running without sound: {}", e.what());
    }

    const auto viewport = device.GetViewport();
    m_position = glm::vec2((viewport.width - kPlayerSize) * 0.5f,
                           (viewport.height - kPlayerSize) * 0.5f);
}

void PlayScene::Update(const gw::core::GameTime& gameTime) {
    const auto& keyboard = GetCore().Input().Keyboard();

    glm::vec2 direction(0.0f);
    if (keyboard.IsKeyDown(gw::input::Key::Left)) direction.x -= 1.0f;
    if (keyboard.IsKeyDown(gw::input::Key::Right)) direction.x += 1.0f;
    if (keyboard.IsKeyDown(gw::input::Key::Up)) direction.y -= 1.0f;
    if (keyboard.IsKeyDown(gw::input::Key::Down)) direction.y += 1.0f;
    m_position += direction * kPlayerSpeed * gameTime.DeltaSeconds();

    const auto viewport = GetCore().GraphicsDevice().GetViewport();
    m_position.x = std::clamp(m_position.x, 0.0f, static_cast<float>(viewport.width - kPlayerSize));
    m_position.y = std::clamp(m_position.y, 0.0f, static_cast<float>(viewport.height - kPlayerSize));

    if (keyboard.WasKeyJustPressed(gw::input::Key::Space) && m_blip) {
        const float pan = (m_position.x / static_cast<float>(viewport.width)) * 2.0f - 1.0f;
        GetCore().Audio().PlaySoundEffect(*m_blip, 1.0f, pan);
    }
    if (keyboard.WasKeyJustPressed(gw::input::Key::M)) {
        GetCore().Audio().ToggleMute();
    }
    if (keyboard.WasKeyJustPressed(gw::input::Key::Backspace)) {
        GetCore().ChangeScene(std::make_shared<TitleScene>(GetCore()));
    }
}

void PlayScene::Draw(const gw::core::GameTime& gameTime) {
    (void)gameTime;
    auto& device = GetCore().GraphicsDevice();
    device.Clear(gw::graphics::Color::Black);

    const auto viewport = device.GetViewport();
    auto& batch = GetCore().SpriteBatch();
    batch.Begin(gw::graphics::SpriteSortMode::Deferred, gw::graphics::BlendState::AlphaBlend);
    for (int y = 0; y < viewport.height; y += m_background->Height()) {
        for (int x = 0; x < viewport.width; x += m_background->Width()) {
            batch.Draw(*m_background, glm::vec2(static_cast<float>(x), static_cast<float>(y)),
                       gw::graphics::Color::White);
        }
    }
    batch.Draw(*m_player, m_position, gw::graphics::Color::White);
    batch.End();
}
