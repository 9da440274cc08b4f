#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>

#include "gw/graphics/Color.hpp"
#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/Rectangle.hpp"

namespace gw::graphics {

class Texture2D;

enum class SpriteSortMode {
    Deferred,     // submission order, drawn at End()
    Immediate,    // every Draw is submitted right away
    Texture,      // grouped by texture
    BackToFront,  // highest layer depth first
    FrontToBack   // lowest layer depth first
};

enum class SpriteEffects : unsigned {
    None = 0,
    FlipHorizontally = 1u << 0,
    FlipVertically = 1u << 1
};

inline SpriteEffects operator|(SpriteEffects lhs, SpriteEffects rhs) {
    return static_cast<SpriteEffects>(static_cast<unsigned>(lhs) | static_cast<unsigned>(rhs));
}

inline bool HasEffect(SpriteEffects value, SpriteEffects flag) {
    return (static_cast<unsigned>(value) & static_cast<unsigned>(flag)) != 0;
}

/**
 * @brief Collects textured quads between Begin() and End() and submits them
 * to the GraphicsDevice, one DrawSprites call per run of sprites sharing a
 * texture.
 *
 * Coordinates are in back buffer pixels with the origin at the top-left.
 */
class SpriteBatch {
public:
    explicit SpriteBatch(GraphicsDevice& device);

    SpriteBatch(const SpriteBatch&) = delete;
    SpriteBatch& operator=(const SpriteBatch&) = delete;

    // Throws InvalidOperationError if a batch is already open.
    void Begin(SpriteSortMode sortMode = SpriteSortMode::Deferred,
               BlendState blendState = BlendState::AlphaBlend,
               const glm::mat4& transform = glm::mat4(1.0f));

    // All Draw overloads throw InvalidOperationError outside Begin()/End().
    void Draw(const Texture2D& texture, const glm::vec2& position, const Color& color);

    void Draw(const Texture2D& texture,
              const glm::vec2& position,
              const std::optional<Rectangle>& sourceRectangle,
              const Color& color);

    void Draw(const Texture2D& texture,
              const glm::vec2& position,
              const std::optional<Rectangle>& sourceRectangle,
              const Color& color,
              float rotation,
              const glm::vec2& origin,
              const glm::vec2& scale,
              SpriteEffects effects,
              float layerDepth);

    void Draw(const Texture2D& texture, const Rectangle& destination, const Color& color);

    void Draw(const Texture2D& texture,
              const Rectangle& destination,
              const std::optional<Rectangle>& sourceRectangle,
              const Color& color,
              float rotation,
              const glm::vec2& origin,
              SpriteEffects effects,
              float layerDepth);

    // Throws InvalidOperationError if no batch is open.
    void End();

    bool IsActive() const { return m_active; }
    std::size_t QueuedSpriteCount() const { return m_sprites.size(); }

private:
    struct QueuedSprite {
        TextureHandle texture = kInvalidTexture;
        SpriteVertex vertices[kVerticesPerSprite];
        float layerDepth = 0.0f;
    };

    void EnsureActive(const char* operation) const;
    void Enqueue(const Texture2D& texture,
                 const glm::vec2& position,
                 const glm::vec2& size,
                 const glm::vec2& origin,
                 const Rectangle& source,
                 const Color& color,
                 float rotation,
                 SpriteEffects effects,
                 float layerDepth);
    void Flush();
    glm::mat4 BuildTransform() const;

    GraphicsDevice& m_device;
    bool m_active = false;
    SpriteSortMode m_sortMode = SpriteSortMode::Deferred;
    BlendState m_blendState = BlendState::AlphaBlend;
    glm::mat4 m_transform{1.0f};
    std::vector<QueuedSprite> m_sprites;
    std::vector<SpriteVertex> m_vertexScratch;
};

} // namespace gw::graphics
