#include <cmath>
#include <utility>
#include <vellum/logger.hpp>
#include <vellum/plot.hpp>

#include "tick_format.hpp"

namespace vellum
{

Plot::Plot(PlotKind kind, std::string name, std::span<const Point> data)
    : kind_(kind), name_(std::move(name)), data_(data)
{
}

Plot Plot::area(std::string name, std::span<const Point> data)
{
    return Plot(PlotKind::Area, std::move(name), data);
}

Plot Plot::line(std::string name, std::span<const Point> data)
{
    return Plot(PlotKind::Line, std::move(name), data);
}

Plot Plot::scatter(std::string name, std::span<const Point> data)
{
    return Plot(PlotKind::Scatter, std::move(name), data);
}

Plot& Plot::label()
{
    labeled_ = true;
    return *this;
}

std::vector<PathCommand> Plot::path(const BoundDomain& bound) const
{
    std::vector<PathCommand> cmds;
    if (data_.empty())
        return cmds;

    switch (kind_)
    {
        case PlotKind::Line:
        {
            cmds.reserve(data_.size());
            for (size_t i = 0; i < data_.size(); ++i)
            {
                cmds.push_back({i == 0 ? PathOp::Move : PathOp::Line,
                                bound.x_map(data_[i].x),
                                bound.y_map(data_[i].y)});
            }
            break;
        }
        case PlotKind::Area:
        {
            // Closed outline: down to the zero baseline under each end.
            const int32_t base    = bound.y_map(0.0f);
            const int32_t first_x = bound.x_map(data_.front().x);
            const int32_t last_x  = bound.x_map(data_.back().x);
            cmds.reserve(data_.size() + 3);
            cmds.push_back({PathOp::Move, first_x, base});
            for (const Point& pt : data_)
                cmds.push_back({PathOp::Line, bound.x_map(pt.x), bound.y_map(pt.y)});
            cmds.push_back({PathOp::Line, last_x, base});
            cmds.push_back({PathOp::Close, first_x, base});
            break;
        }
        case PlotKind::Scatter:
        {
            cmds.reserve(data_.size());
            for (const Point& pt : data_)
                cmds.push_back({PathOp::Move, bound.x_map(pt.x), bound.y_map(pt.y)});
            break;
        }
    }

    VELLUM_LOG_TRACE("plot", "'{}': {} path commands", name_, cmds.size());
    return cmds;
}

std::vector<TextPlacement> Plot::point_labels(const BoundDomain& bound) const
{
    std::vector<TextPlacement> labels;
    if (!labeled_)
        return labels;
    labels.reserve(data_.size());
    for (const Point& pt : data_)
    {
        labels.push_back({bound.x_map(pt.x),
                          bound.y_map(pt.y),
                          "(" + format_data_value(pt.x) + " " + format_data_value(pt.y) + ")"});
    }
    return labels;
}

}   // namespace vellum
