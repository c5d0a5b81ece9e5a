#include <cmath>
#include <utility>
#include <vellum/axis.hpp>

namespace vellum
{

Axis::Axis(Edge edge, std::vector<Tick> ticks, std::string name)
    : edge_(edge), ticks_(std::move(ticks)), name_(std::move(name))
{
}

uint16_t Axis::space(const LayoutConfig& config) const
{
    return has_name() ? config.named_axis_space : config.axis_space;
}

RectSplit Axis::reserve(const Rect& area, const LayoutConfig& config) const
{
    return area.split(edge_, space(config));
}

int32_t tick_x(const Tick& tick, Edge edge, const Rect& rect, int32_t offset)
{
    switch (edge)
    {
        case Edge::Left:
            return rect.right() - offset;
        case Edge::Right:
            return rect.x + offset;
        default:
            return rect.x + static_cast<int32_t>(std::lround(tick.value * rect.width));
    }
}

int32_t tick_y(const Tick& tick, Edge edge, const Rect& rect, int32_t offset)
{
    switch (edge)
    {
        case Edge::Top:
            return rect.bottom() - offset;
        case Edge::Bottom:
            return rect.y + offset;
        default:
            return rect.y + static_cast<int32_t>(std::lround(tick.value * rect.height));
    }
}

AxisGeometry Axis::layout(const Rect& band, const Rect& plot_area, const LayoutConfig& config) const
{
    AxisGeometry geo;
    geo.edge = edge_;

    Rect rect = is_horizontal(edge_) ? band.intersect_horiz(plot_area) : band.intersect_vert(plot_area);
    geo.band  = rect;

    if (has_name())
    {
        RectSplit parts = rect.split(edge_, static_cast<uint16_t>(space(config) / 2));
        geo.name_rect   = parts.carved;
        rect            = parts.remainder;
    }

    const int32_t len = config.tick_length;

    // Axis line on the plot side of the band, tick marks reaching back to it.
    switch (edge_)
    {
        case Edge::Top:
            geo.line = {rect.x, rect.bottom(), static_cast<int32_t>(rect.width), 0};
            break;
        case Edge::Bottom:
            geo.line = {rect.x, rect.y, static_cast<int32_t>(rect.width), 0};
            break;
        case Edge::Left:
            geo.line = {rect.right(), rect.y, 0, static_cast<int32_t>(rect.height)};
            break;
        case Edge::Right:
            geo.line = {rect.x, rect.y, 0, static_cast<int32_t>(rect.height)};
            break;
    }

    geo.tick_marks.reserve(ticks_.size());
    for (const Tick& t : ticks_)
    {
        Segment s{tick_x(t, edge_, rect, len), tick_y(t, edge_, rect, len), 0, 0};
        switch (edge_)
        {
            case Edge::Top:
                s.dy = len;
                break;
            case Edge::Bottom:
                s.dy = -len;
                break;
            case Edge::Left:
                s.dx = len;
                break;
            case Edge::Right:
                s.dx = -len;
                break;
        }
        geo.tick_marks.push_back(s);
    }

    if (edge_ == Edge::Left)
        geo.label_anchor = Anchor::End;
    else if (edge_ == Edge::Right)
        geo.label_anchor = Anchor::Start;
    else
        geo.label_anchor = Anchor::Middle;

    geo.labels.reserve(ticks_.size());
    for (const Tick& t : ticks_)
    {
        geo.labels.push_back({tick_x(t, edge_, rect, config.label_gap_horizontal),
                              tick_y(t, edge_, rect, config.label_gap_vertical),
                              t.text});
    }
    return geo;
}

std::vector<Segment> Axis::grid_lines(const Rect& plot_area) const
{
    std::vector<Segment> lines;
    lines.reserve(ticks_.size());
    for (const Tick& t : ticks_)
    {
        if (is_horizontal(edge_))
            lines.push_back({tick_x(t, edge_, plot_area, 0),
                             plot_area.y,
                             0,
                             static_cast<int32_t>(plot_area.height)});
        else
            lines.push_back({plot_area.x,
                             tick_y(t, edge_, plot_area, 0),
                             static_cast<int32_t>(plot_area.width),
                             0});
    }
    return lines;
}

}   // namespace vellum
