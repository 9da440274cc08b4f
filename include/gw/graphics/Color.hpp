#pragma once
#include <cstdint>
#include <glm/vec4.hpp>

namespace gw::graphics {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(std::uint8_t red, std::uint8_t green, std::uint8_t blue, std::uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    // Channels in [0, 1]; out-of-range values are clamped.
    static Color FromFloats(float red, float green, float blue, float alpha = 1.0f);

    glm::vec4 ToVec4() const;

    // Scales every channel, alpha included, as premultiplied fades expect.
    Color operator*(float scale) const;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static const Color Transparent;
    static const Color Black;
    static const Color White;
    static const Color Red;
    static const Color Green;
    static const Color Blue;
    static const Color Yellow;
    static const Color Gray;
    static const Color CornflowerBlue;
};

} // namespace gw::graphics
