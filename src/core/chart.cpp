#include <utility>
#include <vellum/chart.hpp>
#include <vellum/logger.hpp>

namespace vellum
{

ChartBuilder Chart::builder()
{
    return ChartBuilder();
}

void Chart::reset_area()
{
    area_ = canvas_rect(aspect_).inset(config_.margin);
}

void Chart::add_title(Title title)
{
    RectSplit parts = title.reserve(area_, config_);
    area_           = parts.remainder;
    titles_.push_back({std::move(title), parts.carved});
}

void Chart::add_axis(Axis axis)
{
    RectSplit parts = axis.reserve(area_, config_);
    if (parts.carved.empty())
        VELLUM_LOG_WARN("layout",
                        "no room for {} axis '{}', band of {} px does not fit",
                        edge_name(axis.edge()),
                        axis.name(),
                        axis.space(config_));
    area_ = parts.remainder;
    axes_.push_back({std::move(axis), parts.carved});
}

void Chart::add_plot(Plot plot)
{
    if (plots_.empty())
        log_layout();
    size_t num = plots_.size();
    plots_.push_back({std::move(plot), domain_.bind(area_), num});
}

void Chart::log_layout() const
{
    VELLUM_LOG_DEBUG("layout",
                     "plot area {}x{} at ({}, {}) after {} titles and {} axes",
                     area_.width,
                     area_.height,
                     area_.x,
                     area_.y,
                     titles_.size(),
                     axes_.size());
}

AxisGeometry Chart::axis_geometry(size_t index) const
{
    const PlacedAxis& placed = axes_.at(index);
    return placed.axis.layout(placed.band, area_, config_);
}

std::vector<Segment> Chart::grid_lines(bool horizontal_axis) const
{
    if (!config_.show_grid)
        return {};
    for (const PlacedAxis& placed : axes_)
    {
        if (is_horizontal(placed.axis.edge()) == horizontal_axis)
            return placed.axis.grid_lines(area_);
    }
    return {};
}

// ─── ChartBuilder ────────────────────────────────────────────────────────────

ChartBuilder ChartBuilder::aspect_ratio(AspectRatio aspect) &&
{
    chart_.aspect_ = aspect;
    return std::move(*this);
}

ChartBuilder ChartBuilder::layout(const LayoutConfig& config) &&
{
    chart_.config_ = config;
    return std::move(*this);
}

TitleStage ChartBuilder::domain(Domain domain) &&
{
    chart_.domain_ = std::move(domain);
    chart_.reset_area();
    return TitleStage(std::move(chart_));
}

// ─── TitleStage ──────────────────────────────────────────────────────────────

TitleStage TitleStage::title(Title title) &&
{
    chart_.add_title(std::move(title));
    return std::move(*this);
}

AxisStage TitleStage::axis(Axis axis) &&
{
    chart_.add_axis(std::move(axis));
    return AxisStage(std::move(chart_));
}

AxisStage TitleStage::axis(std::string name, Edge edge) &&
{
    Axis axis = chart_.domain_.axis(std::move(name), edge);
    return std::move(*this).axis(std::move(axis));
}

PlotStage TitleStage::plot(Plot plot) &&
{
    chart_.add_plot(std::move(plot));
    return PlotStage(std::move(chart_));
}

Chart TitleStage::build() &&
{
    chart_.log_layout();
    return std::move(chart_);
}

// ─── AxisStage ───────────────────────────────────────────────────────────────

AxisStage AxisStage::axis(Axis axis) &&
{
    chart_.add_axis(std::move(axis));
    return std::move(*this);
}

AxisStage AxisStage::axis(std::string name, Edge edge) &&
{
    Axis axis = chart_.domain_.axis(std::move(name), edge);
    return std::move(*this).axis(std::move(axis));
}

PlotStage AxisStage::plot(Plot plot) &&
{
    chart_.add_plot(std::move(plot));
    return PlotStage(std::move(chart_));
}

Chart AxisStage::build() &&
{
    chart_.log_layout();
    return std::move(chart_);
}

// ─── PlotStage ───────────────────────────────────────────────────────────────

PlotStage PlotStage::plot(Plot plot) &&
{
    chart_.add_plot(std::move(plot));
    return std::move(*this);
}

Chart PlotStage::build() &&
{
    return std::move(chart_);
}

}   // namespace vellum
