#include "gw/graphics/OpenGLGraphicsDevice.hpp"

#include <cstddef>
#include <vector>

#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"

namespace gw::graphics {

namespace {

constexpr std::size_t kInitialSpriteCapacity = 256;
constexpr std::size_t kIndicesPerSprite = 6;

constexpr const char* kSpriteVertexShader = R"(#version 330 core
layout(location = 0) in vec2 aPosition;
layout(location = 1) in vec2 aTexCoord;
layout(location = 2) in vec4 aColor;

uniform mat4 uTransform;

out vec2 vTexCoord;
out vec4 vColor;

void main() {
    vTexCoord = aTexCoord;
    vColor = aColor;
    gl_Position = uTransform * vec4(aPosition, 0.0, 1.0);
}
)";

constexpr const char* kSpriteFragmentShader = R"(#version 330 core
in vec2 vTexCoord;
in vec4 vColor;

uniform sampler2D uTexture;

out vec4 FragColor;

void main() {
    FragColor = texture(uTexture, vTexCoord) * vColor;
}
)";

} // namespace

OpenGLGraphicsDevice::OpenGLGraphicsDevice() {
    if (!m_spriteShader.loadFromSource(kSpriteVertexShader, kSpriteFragmentShader)) {
        throw core::GraphicsError("device.create", "sprite shader failed to build");
    }

    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);
    glGenBuffers(1, &m_ebo);
    if (!m_vao || !m_vbo || !m_ebo) {
        throw core::GraphicsError("device.create", "failed to allocate sprite buffers");
    }

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(SpriteVertex),
                          reinterpret_cast<void*>(offsetof(SpriteVertex, position)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(SpriteVertex),
                          reinterpret_cast<void*>(offsetof(SpriteVertex, texCoord)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, sizeof(SpriteVertex),
                          reinterpret_cast<void*>(offsetof(SpriteVertex, color)));
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
    EnsureCapacity(kInitialSpriteCapacity);
    glBindVertexArray(0);

    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    m_spriteShader.Use();
    m_spriteShader.SetInt("uTexture", 0);
}

OpenGLGraphicsDevice::~OpenGLGraphicsDevice() {
    for (TextureHandle texture : m_textures) {
        GLuint id = texture;
        glDeleteTextures(1, &id);
    }
    m_textures.clear();
    if (m_ebo) glDeleteBuffers(1, &m_ebo);
    if (m_vbo) glDeleteBuffers(1, &m_vbo);
    if (m_vao) glDeleteVertexArrays(1, &m_vao);
}

void OpenGLGraphicsDevice::Clear(const Color& color) {
    const glm::vec4 c = color.ToVec4();
    glClearColor(c.r, c.g, c.b, c.a);
    glClear(GL_COLOR_BUFFER_BIT);
}

void OpenGLGraphicsDevice::SetViewport(const Viewport& viewport) {
    m_viewport = viewport;
    glViewport(viewport.x, viewport.y, viewport.width, viewport.height);
}

TextureHandle OpenGLGraphicsDevice::CreateTexture(int width, int height,
                                                  const std::vector<std::uint8_t>& rgbaPixels) {
    if (width <= 0 || height <= 0 ||
        rgbaPixels.size() < static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4) {
        core::Logger::Error("[OpenGLGraphicsDevice] Invalid RGBA8 buffer ({}x{}, size={})",
                            width, height, rgbaPixels.size());
        return kInvalidTexture;
    }

    GLuint id = 0;
    glGenTextures(1, &id);
    if (!id) {
        core::Logger::Error("[OpenGLGraphicsDevice] glGenTextures failed");
        return kInvalidTexture;
    }
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, GL_RGBA,
                 GL_UNSIGNED_BYTE, rgbaPixels.data());

    m_textures.insert(id);
    return id;
}

void OpenGLGraphicsDevice::DestroyTexture(TextureHandle texture) {
    auto it = m_textures.find(texture);
    if (it == m_textures.end()) {
        return;
    }
    GLuint id = texture;
    glDeleteTextures(1, &id);
    m_textures.erase(it);
}

void OpenGLGraphicsDevice::DrawSprites(TextureHandle texture,
                                       const SpriteVertex* vertices,
                                       std::size_t spriteCount,
                                       const glm::mat4& transform,
                                       BlendState blendState) {
    if (!vertices || spriteCount == 0) {
        return;
    }

    ApplyBlendState(blendState);
    m_spriteShader.Use();
    m_spriteShader.SetMat4("uTransform", transform);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture);

    glBindVertexArray(m_vao);
    EnsureCapacity(spriteCount);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferSubData(GL_ARRAY_BUFFER, 0,
                    static_cast<GLsizeiptr>(spriteCount * kVerticesPerSprite * sizeof(SpriteVertex)),
                    vertices);
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(spriteCount * kIndicesPerSprite),
                   GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

void OpenGLGraphicsDevice::EnsureCapacity(std::size_t spriteCount) {
    if (spriteCount <= m_capacity) {
        return;
    }
    std::size_t capacity = m_capacity ? m_capacity : kInitialSpriteCapacity;
    while (capacity < spriteCount) {
        capacity *= 2;
    }

    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(capacity * kVerticesPerSprite * sizeof(SpriteVertex)),
                 nullptr, GL_DYNAMIC_DRAW);

    std::vector<GLuint> indices(capacity * kIndicesPerSprite);
    for (std::size_t i = 0; i < capacity; ++i) {
        const GLuint base = static_cast<GLuint>(i * kVerticesPerSprite);
        const std::size_t o = i * kIndicesPerSprite;
        indices[o + 0] = base + 0;
        indices[o + 1] = base + 1;
        indices[o + 2] = base + 2;
        indices[o + 3] = base + 2;
        indices[o + 4] = base + 3;
        indices[o + 5] = base + 0;
    }
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(indices.size() * sizeof(GLuint)),
                 indices.data(), GL_STATIC_DRAW);

    m_capacity = capacity;
}

void OpenGLGraphicsDevice::ApplyBlendState(BlendState blendState) {
    switch (blendState) {
        case BlendState::Opaque:
            glDisable(GL_BLEND);
            return;
        case BlendState::AlphaBlend:
            glEnable(GL_BLEND);
            glBlendFunc(GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
            return;
        case BlendState::NonPremultiplied:
            glEnable(GL_BLEND);
            glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
            return;
        case BlendState::Additive:
            glEnable(GL_BLEND);
            glBlendFunc(GL_SRC_ALPHA, GL_ONE);
            return;
    }
}

} // namespace gw::graphics
