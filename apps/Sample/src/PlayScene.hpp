#pragma once

#include <memory>

#include <glm/vec2.hpp>

#include "gw/scenes/Scene.hpp"

namespace gw::graphics {
class Texture2D;
}
namespace gw::audio {
class SoundEffect;
}

// Arrow keys move the player, Space plays a blip, M toggles mute and
// Backspace returns to the title.
class PlayScene : public gw::scenes::Scene {
public:
    explicit PlayScene(gw::core::Core& core);

    void LoadContent() override;
    void Update(const gw::core::GameTime& gameTime) override;
    void Draw(const gw::core::GameTime& gameTime) override;

private:
    static constexpr float kPlayerSpeed = 240.0f;
    static constexpr int kPlayerSize = 32;

    std::shared_ptr<gw::graphics::Texture2D> m_background;
    std::shared_ptr<gw::graphics::Texture2D> m_player;
    std::shared_ptr<gw::audio::SoundEffect> m_blip;
    glm::vec2 m_position{0.0f};
};
