#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "gw/graphics/Color.hpp"
#include "gw/graphics/Rectangle.hpp"

namespace gw::graphics {

using TextureHandle = std::uint32_t;
constexpr TextureHandle kInvalidTexture = 0;

enum class BlendState {
    AlphaBlend,        // premultiplied alpha
    NonPremultiplied,
    Additive,
    Opaque
};

// Corners are emitted top-left, top-right, bottom-right, bottom-left.
struct SpriteVertex {
    glm::vec2 position{0.0f};
    glm::vec2 texCoord{0.0f};
    glm::vec4 color{1.0f};
};

constexpr std::size_t kVerticesPerSprite = 4;

/**
 * @brief Rendering backend used by textures and the sprite batch.
 *
 * Implementations own every GPU object they hand out as a TextureHandle.
 */
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

    virtual void Clear(const Color& color) = 0;

    virtual void SetViewport(const Viewport& viewport) = 0;
    virtual Viewport GetViewport() const = 0;

    // Returns kInvalidTexture when the upload fails.
    virtual TextureHandle CreateTexture(int width, int height,
                                        const std::vector<std::uint8_t>& rgbaPixels) = 0;
    virtual void DestroyTexture(TextureHandle texture) = 0;

    // Draws spriteCount quads (kVerticesPerSprite vertices each) sampling one texture.
    virtual void DrawSprites(TextureHandle texture,
                             const SpriteVertex* vertices,
                             std::size_t spriteCount,
                             const glm::mat4& transform,
                             BlendState blendState) = 0;
};

} // namespace gw::graphics
