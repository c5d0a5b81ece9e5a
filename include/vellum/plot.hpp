#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <vellum/axis.hpp>
#include <vellum/domain.hpp>
#include <vellum/point.hpp>

namespace vellum
{

enum class PlotKind : uint8_t
{
    Area,
    Line,
    Scatter,
};

constexpr const char* plot_kind_name(PlotKind k)
{
    switch (k)
    {
        case PlotKind::Area:
            return "area";
        case PlotKind::Line:
            return "line";
        case PlotKind::Scatter:
            return "scatter";
    }
    return "line";
}

// ─── Path Commands ───────────────────────────────────────────────────────────

enum class PathOp : uint8_t
{
    Move,    // start a subpath at (x, y)
    Line,    // straight segment to (x, y)
    Close,   // back to the subpath start; x/y repeat that start
};

struct PathCommand
{
    PathOp  op = PathOp::Move;
    int32_t x  = 0;
    int32_t y  = 0;

    bool operator==(const PathCommand&) const = default;
};

// ─── Markers ─────────────────────────────────────────────────────────────────
// Glyphs drawn at each vertex, cycled per series.

enum class MarkerShape : uint8_t
{
    Circle,
    Square,
    TriangleUp,
    TriangleRight,
    TriangleDown,
    TriangleLeft,
    Diamond,
    Star,
};

inline constexpr size_t marker_shape_count = 8;
inline constexpr size_t style_class_count  = 10;

constexpr MarkerShape marker_for_series(size_t num)
{
    return static_cast<MarkerShape>(num % marker_shape_count);
}

constexpr size_t style_class_for_series(size_t num)
{
    return num % style_class_count;
}

// SVG body of a unit-size glyph centered at the origin.
constexpr const char* marker_glyph(MarkerShape m)
{
    switch (m)
    {
        case MarkerShape::Circle:
            return "<circle r='1' />";
        case MarkerShape::Square:
            return "<rect x='-1' y='-1' width='2' height='2' />";
        case MarkerShape::TriangleUp:
            return "<path d='M0 -1 1 1 -1 1z' />";
        case MarkerShape::TriangleRight:
            return "<path d='M1 0 -1 1 -1 -1z' />";
        case MarkerShape::TriangleDown:
            return "<path d='M0 1 -1 -1 1 -1z' />";
        case MarkerShape::TriangleLeft:
            return "<path d='M-1 0 1 -1 1 1z' />";
        case MarkerShape::Diamond:
            return "<path d='M0 -1 1 0 0 1 -1 0z' />";
        case MarkerShape::Star:
            return "<path d='M-1 -1 0 -0.5 1 -1 0.5 0 1 1 0 0.5 -1 1 -0.5 0z' />";
    }
    return "<circle r='1' />";
}

// ─── Plot ────────────────────────────────────────────────────────────────────

// One data series. The points are borrowed: the caller keeps them alive
// for as long as the plot (or a chart holding it) is rendered.
class Plot
{
   public:
    static Plot area(std::string name, std::span<const Point> data);
    static Plot line(std::string name, std::span<const Point> data);
    static Plot scatter(std::string name, std::span<const Point> data);

    // Annotate every point with its "(x y)" value.
    Plot& label();

    PlotKind               kind() const { return kind_; }
    const std::string&     name() const { return name_; }
    std::span<const Point> data() const { return data_; }
    bool                   labeled() const { return labeled_; }

    // Pixel path for this series under `bound`. Recomputed on every call.
    std::vector<PathCommand> path(const BoundDomain& bound) const;

    // Point annotations, empty unless label() was requested.
    std::vector<TextPlacement> point_labels(const BoundDomain& bound) const;

   private:
    Plot(PlotKind kind, std::string name, std::span<const Point> data);

    PlotKind               kind_;
    std::string            name_;
    std::span<const Point> data_;
    bool                   labeled_ = false;
};

}   // namespace vellum
