#pragma once

#include <cstdint>

namespace vellum
{

enum class Edge : uint8_t
{
    Top,
    Left,
    Bottom,
    Right,
};

constexpr bool is_horizontal(Edge e)
{
    return e == Edge::Top || e == Edge::Bottom;
}

constexpr const char* edge_name(Edge e)
{
    switch (e)
    {
        case Edge::Top:
            return "top";
        case Edge::Left:
            return "left";
        case Edge::Bottom:
            return "bottom";
        case Edge::Right:
            return "right";
    }
    return "unknown";
}

struct RectSplit;

// Axis-aligned pixel rectangle. Screen coordinates: y grows downward.
// Every operation returns a new value; nothing mutates through aliases.
struct Rect
{
    int32_t  x      = 0;
    int32_t  y      = 0;
    uint16_t width  = 0;
    uint16_t height = 0;

    constexpr Rect() = default;
    constexpr Rect(int32_t x, int32_t y, uint16_t width, uint16_t height)
        : x(x), y(y), width(width), height(height)
    {
    }

    constexpr int32_t right() const { return x + static_cast<int32_t>(width); }
    constexpr int32_t bottom() const { return y + static_cast<int32_t>(height); }
    constexpr bool    empty() const { return width == 0 || height == 0; }

    // Shrink by `amount` on all four sides. Sizes saturate at zero.
    Rect inset(uint16_t amount) const;

    // Carve `amount` pixels off `edge`. When `amount` exceeds the available
    // size the carved strip is zero-size and the remainder is *this.
    [[nodiscard]] RectSplit split(Edge edge, uint16_t amount) const;

    // Clip to the horizontal (resp. vertical) extent of `other`.
    Rect intersect_horiz(const Rect& other) const;
    Rect intersect_vert(const Rect& other) const;

    constexpr bool operator==(const Rect&) const = default;
};

struct RectSplit
{
    Rect remainder;
    Rect carved;
};

// Fixed page canvases.
enum class AspectRatio : uint8_t
{
    Landscape,   // 2000 x 1500
    Square,      // 2000 x 2000
    Portrait,    // 1500 x 2000
};

constexpr Rect canvas_rect(AspectRatio ar)
{
    switch (ar)
    {
        case AspectRatio::Landscape:
            return {0, 0, 2000, 1500};
        case AspectRatio::Square:
            return {0, 0, 2000, 2000};
        case AspectRatio::Portrait:
            return {0, 0, 1500, 2000};
    }
    return {0, 0, 2000, 1500};
}

}   // namespace vellum
