#pragma once

#include <cstddef>
#include <string>

namespace vellum
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

// "#rrggbb"; alpha is not encoded.
std::string to_hex(const Color& c);

// Series colors, one per plot style class (plot-0 .. plot-9).
namespace palette
{
inline constexpr Color default_cycle[] = {
    {0.122f, 0.467f, 0.706f},   // steel blue
    {1.000f, 0.498f, 0.055f},   // orange
    {0.173f, 0.627f, 0.173f},   // green
    {0.839f, 0.153f, 0.157f},   // red
    {0.580f, 0.404f, 0.741f},   // purple
    {0.549f, 0.337f, 0.294f},   // brown
    {0.890f, 0.467f, 0.761f},   // pink
    {0.498f, 0.498f, 0.498f},   // gray
    {0.737f, 0.741f, 0.133f},   // olive
    {0.090f, 0.745f, 0.812f},   // cyan
};
inline constexpr size_t default_cycle_size = sizeof(default_cycle) / sizeof(default_cycle[0]);

inline constexpr Color foreground{0.200f, 0.200f, 0.200f};
inline constexpr Color grid{0.867f, 0.867f, 0.867f};
}   // namespace palette

}   // namespace vellum
