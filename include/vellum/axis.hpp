#pragma once

#include <optional>
#include <string>
#include <vector>
#include <vellum/layout.hpp>
#include <vellum/rect.hpp>
#include <vellum/scale.hpp>

namespace vellum
{

// A straight segment from (x, y) moving (dx, dy). Axis geometry only ever
// needs horizontal or vertical runs, so one of dx/dy is zero.
struct Segment
{
    int32_t x  = 0;
    int32_t y  = 0;
    int32_t dx = 0;
    int32_t dy = 0;

    bool operator==(const Segment&) const = default;
};

struct TextPlacement
{
    int32_t     x = 0;
    int32_t     y = 0;
    std::string text;
};

// Everything a renderer needs to draw one axis.
struct AxisGeometry
{
    Edge                       edge = Edge::Bottom;
    Rect                       band;        // reserved band, clipped to the plot area
    std::optional<Rect>        name_rect;   // outer half of the band when named
    Segment                    line;        // runs along the plot side of the band
    std::vector<Segment>       tick_marks;
    Anchor                     label_anchor = Anchor::Middle;
    std::vector<TextPlacement> labels;
};

class Axis
{
   public:
    Axis(Edge edge, std::vector<Tick> ticks, std::string name = {});

    Edge                     edge() const { return edge_; }
    const std::string&       name() const { return name_; }
    bool                     has_name() const { return !name_.empty(); }
    const std::vector<Tick>& ticks() const { return ticks_; }

    // Band height (or width) this axis claims from the working area.
    uint16_t space(const LayoutConfig& config) const;

    // Carve this axis's band off `area`.
    RectSplit reserve(const Rect& area, const LayoutConfig& config) const;

    // Lay the axis out in `band`. The band is first clipped to the extent of
    // the final `plot_area` along the axis direction, since axes reserved
    // later may have narrowed the plot after this band was carved.
    AxisGeometry layout(const Rect& band, const Rect& plot_area, const LayoutConfig& config) const;

    // One line per tick spanning `plot_area`.
    std::vector<Segment> grid_lines(const Rect& plot_area) const;

   private:
    Edge              edge_;
    std::vector<Tick> ticks_;
    std::string       name_;
};

// Pixel position of a tick inside `rect`. Along the axis direction the
// tick's normalized value is scaled into the rect; across it the position
// sits `offset` pixels in from the plot side of the band.
int32_t tick_x(const Tick& tick, Edge edge, const Rect& rect, int32_t offset);
int32_t tick_y(const Tick& tick, Edge edge, const Rect& rect, int32_t offset);

}   // namespace vellum
