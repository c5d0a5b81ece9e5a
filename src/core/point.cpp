#include <algorithm>
#include <vellum/point.hpp>

namespace vellum
{

std::vector<Point> to_points(std::span<const float> x, std::span<const float> y)
{
    const size_t n = std::min(x.size(), y.size());
    std::vector<Point> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
        out.push_back({x[i], y[i]});
    return out;
}

}   // namespace vellum
