#include "TitleScene.hpp"

#include <cmath>

#include "PlayScene.hpp"
#include "gw/core/Core.hpp"
#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/SpriteBatch.hpp"
#include "gw/graphics/Texture2D.hpp"

TitleScene::TitleScene(gw::core::Core& core)
    : gw::scenes::Scene(core, "Title") {}

void TitleScene::LoadContent() {
    m_pixel = gw::graphics::Texture2D::MakeSolid(GetCore().GraphicsDevice(), 1, 1,
                                                 gw::graphics::Color::White);
}

void TitleScene::Update(const gw::core::GameTime& gameTime) {
    m_pulse += gameTime.DeltaSeconds();

    if (GetCore().Input().Keyboard().WasKeyJustPressed(gw::input::Key::Enter)) {
        GetCore().ChangeScene(std::make_shared<PlayScene>(GetCore()));
    }
}

void TitleScene::Draw(const gw::core::GameTime& gameTime) {
    (void)gameTime;
    auto& device = GetCore().GraphicsDevice();
    device.Clear(gw::graphics::Color::CornflowerBlue);

    const auto viewport = device.GetViewport();
    const float alpha = 0.6f + 0.4f * std::sin(m_pulse * 3.0f);
    const int bannerWidth = viewport.width / 2;
    const int bannerHeight = viewport.height / 8;

    auto& batch = GetCore().SpriteBatch();
    batch.Begin();
    batch.Draw(*m_pixel,
               gw::graphics::Rectangle((viewport.width - bannerWidth) / 2,
                                       (viewport.height - bannerHeight) / 2,
                                       bannerWidth, bannerHeight),
               gw::graphics::Color::White * alpha);
    batch.End();
}
