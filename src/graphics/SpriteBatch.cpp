#include "gw/graphics/SpriteBatch.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <glm/gtc/matrix_transform.hpp>

#include "gw/core/Error.hpp"
#include "gw/graphics/Texture2D.hpp"

namespace gw::graphics {

SpriteBatch::SpriteBatch(GraphicsDevice& device)
    : m_device(device) {}

void SpriteBatch::Begin(SpriteSortMode sortMode, BlendState blendState, const glm::mat4& transform) {
    if (m_active) {
        throw core::InvalidOperationError(
            "SpriteBatch::Begin cannot be called again until End has been called");
    }
    m_active = true;
    m_sortMode = sortMode;
    m_blendState = blendState;
    m_transform = transform;
    m_sprites.clear();
}

void SpriteBatch::Draw(const Texture2D& texture, const glm::vec2& position, const Color& color) {
    Draw(texture, position, std::nullopt, color, 0.0f, glm::vec2(0.0f), glm::vec2(1.0f),
         SpriteEffects::None, 0.0f);
}

void SpriteBatch::Draw(const Texture2D& texture,
                       const glm::vec2& position,
                       const std::optional<Rectangle>& sourceRectangle,
                       const Color& color) {
    Draw(texture, position, sourceRectangle, color, 0.0f, glm::vec2(0.0f), glm::vec2(1.0f),
         SpriteEffects::None, 0.0f);
}

void SpriteBatch::Draw(const Texture2D& texture,
                       const glm::vec2& position,
                       const std::optional<Rectangle>& sourceRectangle,
                       const Color& color,
                       float rotation,
                       const glm::vec2& origin,
                       const glm::vec2& scale,
                       SpriteEffects effects,
                       float layerDepth) {
    EnsureActive("Draw");
    const Rectangle source = sourceRectangle.value_or(texture.Bounds());
    const glm::vec2 size(static_cast<float>(source.width) * scale.x,
                         static_cast<float>(source.height) * scale.y);
    Enqueue(texture, position, size, origin * scale, source, color, rotation, effects, layerDepth);
}

void SpriteBatch::Draw(const Texture2D& texture, const Rectangle& destination, const Color& color) {
    Draw(texture, destination, std::nullopt, color, 0.0f, glm::vec2(0.0f), SpriteEffects::None, 0.0f);
}

void SpriteBatch::Draw(const Texture2D& texture,
                       const Rectangle& destination,
                       const std::optional<Rectangle>& sourceRectangle,
                       const Color& color,
                       float rotation,
                       const glm::vec2& origin,
                       SpriteEffects effects,
                       float layerDepth) {
    EnsureActive("Draw");
    const Rectangle source = sourceRectangle.value_or(texture.Bounds());
    const glm::vec2 size(static_cast<float>(destination.width),
                         static_cast<float>(destination.height));

    // Origin is given in source pixels; map it into destination space.
    glm::vec2 scaledOrigin(0.0f);
    if (source.width != 0 && source.height != 0) {
        scaledOrigin = glm::vec2(origin.x * size.x / static_cast<float>(source.width),
                                 origin.y * size.y / static_cast<float>(source.height));
    }
    Enqueue(texture,
            glm::vec2(static_cast<float>(destination.x), static_cast<float>(destination.y)),
            size, scaledOrigin, source, color, rotation, effects, layerDepth);
}

void SpriteBatch::End() {
    EnsureActive("End");
    Flush();
    m_active = false;
}

void SpriteBatch::EnsureActive(const char* operation) const {
    if (!m_active) {
        throw core::InvalidOperationError(
            std::string("SpriteBatch::") + operation + " requires Begin to be called first");
    }
}

void SpriteBatch::Enqueue(const Texture2D& texture,
                          const glm::vec2& position,
                          const glm::vec2& size,
                          const glm::vec2& origin,
                          const Rectangle& source,
                          const Color& color,
                          float rotation,
                          SpriteEffects effects,
                          float layerDepth) {
    QueuedSprite sprite;
    sprite.texture = texture.Handle();
    sprite.layerDepth = layerDepth;

    const float texW = static_cast<float>(texture.Width());
    const float texH = static_cast<float>(texture.Height());
    float u0 = texW > 0.0f ? static_cast<float>(source.Left()) / texW : 0.0f;
    float u1 = texW > 0.0f ? static_cast<float>(source.Right()) / texW : 1.0f;
    float v0 = texH > 0.0f ? static_cast<float>(source.Top()) / texH : 0.0f;
    float v1 = texH > 0.0f ? static_cast<float>(source.Bottom()) / texH : 1.0f;
    if (HasEffect(effects, SpriteEffects::FlipHorizontally)) {
        std::swap(u0, u1);
    }
    if (HasEffect(effects, SpriteEffects::FlipVertically)) {
        std::swap(v0, v1);
    }

    const glm::vec2 corners[kVerticesPerSprite] = {
        {-origin.x, -origin.y},
        {size.x - origin.x, -origin.y},
        {size.x - origin.x, size.y - origin.y},
        {-origin.x, size.y - origin.y},
    };
    const glm::vec2 texCoords[kVerticesPerSprite] = {
        {u0, v0}, {u1, v0}, {u1, v1}, {u0, v1},
    };

    const float cosR = std::cos(rotation);
    const float sinR = std::sin(rotation);
    const glm::vec4 tint = color.ToVec4();
    for (std::size_t i = 0; i < kVerticesPerSprite; ++i) {
        const glm::vec2& c = corners[i];
        sprite.vertices[i].position = position + glm::vec2(c.x * cosR - c.y * sinR,
                                                           c.x * sinR + c.y * cosR);
        sprite.vertices[i].texCoord = texCoords[i];
        sprite.vertices[i].color = tint;
    }

    m_sprites.push_back(sprite);

    if (m_sortMode == SpriteSortMode::Immediate) {
        Flush();
    }
}

void SpriteBatch::Flush() {
    if (m_sprites.empty()) {
        return;
    }

    switch (m_sortMode) {
        case SpriteSortMode::Texture:
            std::stable_sort(m_sprites.begin(), m_sprites.end(),
                             [](const QueuedSprite& a, const QueuedSprite& b) { return a.texture < b.texture; });
            break;
        case SpriteSortMode::BackToFront:
            std::stable_sort(m_sprites.begin(), m_sprites.end(),
                             [](const QueuedSprite& a, const QueuedSprite& b) { return a.layerDepth > b.layerDepth; });
            break;
        case SpriteSortMode::FrontToBack:
            std::stable_sort(m_sprites.begin(), m_sprites.end(),
                             [](const QueuedSprite& a, const QueuedSprite& b) { return a.layerDepth < b.layerDepth; });
            break;
        case SpriteSortMode::Deferred:
        case SpriteSortMode::Immediate:
            break;
    }

    const glm::mat4 transform = BuildTransform();
    std::size_t runStart = 0;
    while (runStart < m_sprites.size()) {
        const TextureHandle texture = m_sprites[runStart].texture;
        std::size_t runEnd = runStart + 1;
        while (runEnd < m_sprites.size() && m_sprites[runEnd].texture == texture) {
            ++runEnd;
        }

        m_vertexScratch.clear();
        m_vertexScratch.reserve((runEnd - runStart) * kVerticesPerSprite);
        for (std::size_t i = runStart; i < runEnd; ++i) {
            m_vertexScratch.insert(m_vertexScratch.end(),
                                   std::begin(m_sprites[i].vertices),
                                   std::end(m_sprites[i].vertices));
        }
        m_device.DrawSprites(texture, m_vertexScratch.data(), runEnd - runStart, transform, m_blendState);
        runStart = runEnd;
    }

    m_sprites.clear();
}

glm::mat4 SpriteBatch::BuildTransform() const {
    const Viewport viewport = m_device.GetViewport();
    const float width = static_cast<float>(viewport.width > 0 ? viewport.width : 1);
    const float height = static_cast<float>(viewport.height > 0 ? viewport.height : 1);
    const glm::mat4 projection = glm::ortho(0.0f, width, height, 0.0f, -1.0f, 1.0f);
    return projection * m_transform;
}

} // namespace gw::graphics
