#pragma once
#include <glad/glad.h>
#include <unordered_set>

#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/Shader.hpp"

namespace gw::graphics {

/**
 * @brief GraphicsDevice on an OpenGL 3.3 core context.
 *
 * Must be created and destroyed while the context is current; GLAD has to be
 * loaded before construction.
 */
class OpenGLGraphicsDevice final : public GraphicsDevice {
public:
    // Throws GraphicsError when the sprite shader or buffers cannot be created.
    OpenGLGraphicsDevice();
    ~OpenGLGraphicsDevice() override;

    OpenGLGraphicsDevice(const OpenGLGraphicsDevice&) = delete;
    OpenGLGraphicsDevice& operator=(const OpenGLGraphicsDevice&) = delete;

    void Clear(const Color& color) override;

    void SetViewport(const Viewport& viewport) override;
    Viewport GetViewport() const override { return m_viewport; }

    TextureHandle CreateTexture(int width, int height,
                                const std::vector<std::uint8_t>& rgbaPixels) override;
    void DestroyTexture(TextureHandle texture) override;

    void DrawSprites(TextureHandle texture,
                     const SpriteVertex* vertices,
                     std::size_t spriteCount,
                     const glm::mat4& transform,
                     BlendState blendState) override;

private:
    void EnsureCapacity(std::size_t spriteCount);
    void ApplyBlendState(BlendState blendState);

    Shader m_spriteShader;
    GLuint m_vao = 0;
    GLuint m_vbo = 0;
    GLuint m_ebo = 0;
    std::size_t m_capacity = 0;
    Viewport m_viewport;
    // Handles are GL texture names; tracked so leftovers die with the device.
    std::unordered_set<TextureHandle> m_textures;
};

} // namespace gw::graphics
