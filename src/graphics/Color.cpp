#include "gw/graphics/Color.hpp"

#include <algorithm>
#include <cmath>

namespace gw::graphics {

namespace {
std::uint8_t ToChannel(float value) {
    const float clamped = std::clamp(value, 0.0f, 1.0f);
    return static_cast<std::uint8_t>(std::lround(clamped * 255.0f));
}
} // namespace

const Color Color::Transparent{0, 0, 0, 0};
const Color Color::Black{0, 0, 0, 255};
const Color Color::White{255, 255, 255, 255};
const Color Color::Red{255, 0, 0, 255};
const Color Color::Green{0, 128, 0, 255};
const Color Color::Blue{0, 0, 255, 255};
const Color Color::Yellow{255, 255, 0, 255};
const Color Color::Gray{128, 128, 128, 255};
const Color Color::CornflowerBlue{100, 149, 237, 255};

Color Color::FromFloats(float red, float green, float blue, float alpha) {
    return Color(ToChannel(red), ToChannel(green), ToChannel(blue), ToChannel(alpha));
}

glm::vec4 Color::ToVec4() const {
    return glm::vec4(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
}

Color Color::operator*(float scale) const {
    const glm::vec4 v = ToVec4() * scale;
    return FromFloats(v.r, v.g, v.b, v.a);
}

} // namespace gw::graphics
