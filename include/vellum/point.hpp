#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace vellum
{

// A data point in data space (not pixels).
struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

// ─── Conversions ─────────────────────────────────────────────────────────────
// Plots borrow a std::span<const Point>, so callers holding data in another
// shape convert once and keep the vector alive for the chart's lifetime.

inline Point make_point(const Point& p)
{
    return p;
}

template <typename A, typename B>
Point make_point(const std::pair<A, B>& p)
{
    return {static_cast<float>(p.first), static_cast<float>(p.second)};
}

template <typename T>
Point make_point(const std::array<T, 2>& p)
{
    return {static_cast<float>(p[0]), static_cast<float>(p[1])};
}

template <typename Range>
std::vector<Point> to_points(const Range& range)
{
    std::vector<Point> out;
    for (const auto& v : range)
        out.push_back(make_point(v));
    return out;
}

// Zip parallel x/y arrays. Extra elements of the longer array are ignored.
std::vector<Point> to_points(std::span<const float> x, std::span<const float> y);

}   // namespace vellum
