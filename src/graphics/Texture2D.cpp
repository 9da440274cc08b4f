#include "gw/graphics/Texture2D.hpp"

#include <cstring>
#include <string>

#include <stb_image.h>

#include "gw/core/Error.hpp"
#include "gw/core/Logger.hpp"

namespace gw::graphics {

Texture2D::Texture2D(GraphicsDevice& device, TextureHandle handle, int width, int height)
    : m_device(&device),
      m_handle(handle),
      m_width(width),
      m_height(height) {}

Texture2D::~Texture2D() {
    if (m_device && m_handle != kInvalidTexture) {
        m_device->DestroyTexture(m_handle);
    }
}

std::shared_ptr<Texture2D> Texture2D::FromPixels(GraphicsDevice& device,
                                                 int width, int height,
                                                 const std::vector<std::uint8_t>& rgbaPixels) {
    if (width <= 0 || height <= 0 ||
        rgbaPixels.size() < static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4) {
        throw core::GraphicsError("texture.create",
                                  "invalid RGBA8 buffer (" + std::to_string(width) + "x" +
                                      std::to_string(height) + ", size=" +
                                      std::to_string(rgbaPixels.size()) + ")");
    }

    const TextureHandle handle = device.CreateTexture(width, height, rgbaPixels);
    if (handle == kInvalidTexture) {
        throw core::GraphicsError("texture.create", "device rejected the texture upload");
    }
    return std::make_shared<Texture2D>(device, handle, width, height);
}

std::shared_ptr<Texture2D> Texture2D::FromFile(GraphicsDevice& device,
                                               const std::filesystem::path& path) {
    // Sprites use a top-left origin, so rows stay in file order.
    stbi_set_flip_vertically_on_load(0);

    int w = 0, h = 0, comp = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &comp, 4);
    if (!data) {
        std::string reason = stbi_failure_reason() ? stbi_failure_reason() : "unknown";
        throw core::GraphicsError("texture.load", "Failed to decode " + path.string() + ": " + reason);
    }

    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4);
    std::memcpy(pixels.data(), data, pixels.size());
    stbi_image_free(data);

    auto texture = FromPixels(device, w, h, pixels);
    core::Logger::Debug("[Texture2D] Loaded '{}' ({}x{})", path.string(), w, h);
    return texture;
}

std::shared_ptr<Texture2D> Texture2D::MakeSolid(GraphicsDevice& device,
                                                int width, int height,
                                                const Color& color) {
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width > 0 ? width : 0) *
                                     static_cast<std::size_t>(height > 0 ? height : 0) * 4);
    for (std::size_t i = 0; i + 3 < pixels.size(); i += 4) {
        pixels[i + 0] = color.r;
        pixels[i + 1] = color.g;
        pixels[i + 2] = color.b;
        pixels[i + 3] = color.a;
    }
    return FromPixels(device, width, height, pixels);
}

} // namespace gw::graphics
