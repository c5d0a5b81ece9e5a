#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vellum/color.hpp>

namespace vellum
{

std::string to_hex(const Color& c)
{
    auto channel = [](float v)
    { return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };

    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", channel(c.r), channel(c.g), channel(c.b));
    return buf;
}

}   // namespace vellum
