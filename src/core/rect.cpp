#include <algorithm>
#include <vellum/rect.hpp>

namespace vellum
{

namespace
{

uint16_t saturating_sub(uint16_t a, uint32_t b)
{
    return a > b ? static_cast<uint16_t>(a - b) : uint16_t{0};
}

uint16_t clamp_extent(int32_t v)
{
    return static_cast<uint16_t>(std::clamp<int32_t>(v, 0, UINT16_MAX));
}

}   // anonymous namespace

Rect Rect::inset(uint16_t amount) const
{
    const uint32_t twice = 2u * amount;
    return {x + amount, y + amount, saturating_sub(width, twice), saturating_sub(height, twice)};
}

RectSplit Rect::split(Edge edge, uint16_t amount) const
{
    const uint16_t available = is_horizontal(edge) ? height : width;
    if (amount > available)
        return {*this, Rect{x, y, is_horizontal(edge) ? width : uint16_t{0},
                            is_horizontal(edge) ? uint16_t{0} : height}};

    const uint16_t rest = static_cast<uint16_t>(available - amount);
    switch (edge)
    {
        case Edge::Top:
            return {{x, y + amount, width, rest}, {x, y, width, amount}};
        case Edge::Bottom:
            return {{x, y, width, rest}, {x, y + rest, width, amount}};
        case Edge::Left:
            return {{x + amount, y, rest, height}, {x, y, amount, height}};
        case Edge::Right:
            return {{x, y, rest, height}, {x + rest, y, amount, height}};
    }
    return {*this, Rect{}};
}

Rect Rect::intersect_horiz(const Rect& other) const
{
    const int32_t left  = std::max(x, other.x);
    const int32_t right = std::min(this->right(), other.right());
    return {left, y, clamp_extent(right - left), height};
}

Rect Rect::intersect_vert(const Rect& other) const
{
    const int32_t top    = std::max(y, other.y);
    const int32_t bottom = std::min(this->bottom(), other.bottom());
    return {x, top, width, clamp_extent(bottom - top)};
}

}   // namespace vellum
