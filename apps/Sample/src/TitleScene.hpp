#pragma once

#include <memory>

#include "gw/scenes/Scene.hpp"

namespace gw::graphics {
class Texture2D;
}

// Pulsing banner; Enter starts the game.
class TitleScene : public gw::scenes::Scene {
public:
    explicit TitleScene(gw::core::Core& core);

    void LoadContent() override;
    void Update(const gw::core::GameTime& gameTime) override;
    void Draw(const gw::core::GameTime& gameTime) override;

private:
    std::shared_ptr<gw::graphics::Texture2D> m_pixel;
    float m_pulse = 0.0f;
};
