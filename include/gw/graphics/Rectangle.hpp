#pragma once

namespace gw::graphics {

struct Rectangle {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    constexpr Rectangle() = default;
    constexpr Rectangle(int x_, int y_, int width_, int height_)
        : x(x_), y(y_), width(width_), height(height_) {}

    constexpr int Left() const { return x; }
    constexpr int Right() const { return x + width; }
    constexpr int Top() const { return y; }
    constexpr int Bottom() const { return y + height; }
    constexpr bool IsEmpty() const { return width <= 0 || height <= 0; }

    // Right and bottom edges are exclusive.
    constexpr bool Contains(int px, int py) const {
        return px >= Left() && px < Right() && py >= Top() && py < Bottom();
    }

    constexpr bool Intersects(const Rectangle& other) const {
        return other.Left() < Right() && Left() < other.Right() &&
               other.Top() < Bottom() && Top() < other.Bottom();
    }

    constexpr bool operator==(const Rectangle& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    constexpr bool operator!=(const Rectangle& other) const { return !(*this == other); }
};

struct Viewport {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

} // namespace gw::graphics
