#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "gw/graphics/GraphicsDevice.hpp"
#include "gw/graphics/Rectangle.hpp"

namespace gw::graphics {

class Texture2D {
public:
    Texture2D(GraphicsDevice& device, TextureHandle handle, int width, int height);
    ~Texture2D();

    Texture2D(const Texture2D&) = delete;
    Texture2D& operator=(const Texture2D&) = delete;

    // Throws GraphicsError when the buffer is too small or the upload fails.
    static std::shared_ptr<Texture2D> FromPixels(GraphicsDevice& device,
                                                 int width, int height,
                                                 const std::vector<std::uint8_t>& rgbaPixels);

    // Decodes PNG, JPEG, BMP, TGA or PNM. Throws GraphicsError on failure.
    static std::shared_ptr<Texture2D> FromFile(GraphicsDevice& device,
                                               const std::filesystem::path& path);

    static std::shared_ptr<Texture2D> MakeSolid(GraphicsDevice& device,
                                                int width, int height,
                                                const Color& color);

    int Width() const { return m_width; }
    int Height() const { return m_height; }
    Rectangle Bounds() const { return Rectangle(0, 0, m_width, m_height); }
    TextureHandle Handle() const { return m_handle; }

private:
    GraphicsDevice* m_device = nullptr;
    TextureHandle m_handle = kInvalidTexture;
    int m_width = 0;
    int m_height = 0;
};

} // namespace gw::graphics
