#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <vellum/axis.hpp>
#include <vellum/domain.hpp>
#include <vellum/layout.hpp>
#include <vellum/plot.hpp>
#include <vellum/rect.hpp>
#include <vellum/title.hpp>

namespace vellum
{

class ChartBuilder;
class TitleStage;
class AxisStage;
class PlotStage;

struct PlacedTitle
{
    Title title;
    Rect  band;
};

struct PlacedAxis
{
    Axis axis;
    Rect band;   // as carved; clipped to the plot area at layout time
};

struct PlacedPlot
{
    Plot        plot;
    BoundDomain bound;
    size_t      num = 0;   // insertion index; picks marker and style class
};

/// A fully laid out chart.
///
/// Built through the phased builder:
///
///     Chart chart = Chart::builder()
///                       .aspect_ratio(AspectRatio::Square)
///                       .domain(Domain::from_data(points))
///                       .title(Title("Rainfall"))
///                       .axis("Month", Edge::Bottom)
///                       .axis("", Edge::Left)
///                       .plot(Plot::line("2024", points))
///                       .build();
///
/// Each phase only offers what may legally follow, so a title after an axis
/// or an axis after a plot is a compile error.  The canvas is carved as
/// each piece is added: margin, then titles, then axes; whatever remains is
/// the plot area.
class Chart
{
   public:
    static ChartBuilder builder();

    AspectRatio         aspect_ratio() const { return aspect_; }
    Rect                canvas() const { return canvas_rect(aspect_); }
    const LayoutConfig& config() const { return config_; }
    const Domain&       domain() const { return domain_; }
    const Rect&         plot_area() const { return area_; }

    const std::vector<PlacedTitle>& titles() const { return titles_; }
    const std::vector<PlacedAxis>&  axes() const { return axes_; }
    const std::vector<PlacedPlot>&  plots() const { return plots_; }

    /// Tick marks, labels and name strip for axis `index`.
    AxisGeometry axis_geometry(size_t index) const;

    /// Grid lines through the plot area, drawn from the first axis of the
    /// requested orientation.  Empty when grids are disabled or no such axis
    /// exists.
    std::vector<Segment> grid_lines(bool horizontal_axis) const;

   private:
    friend class ChartBuilder;
    friend class TitleStage;
    friend class AxisStage;
    friend class PlotStage;

    Chart() = default;

    void reset_area();
    void add_title(Title title);
    void add_axis(Axis axis);
    void add_plot(Plot plot);
    void log_layout() const;

    AspectRatio              aspect_ = AspectRatio::Landscape;
    LayoutConfig             config_;
    Domain                   domain_;
    Rect                     area_;
    std::vector<PlacedTitle> titles_;
    std::vector<PlacedAxis>  axes_;
    std::vector<PlacedPlot>  plots_;
};

// ─── Builder Phases ──────────────────────────────────────────────────────────

class PlotStage
{
   public:
    PlotStage plot(Plot plot) &&;
    Chart     build() &&;

   private:
    friend class TitleStage;
    friend class AxisStage;
    explicit PlotStage(Chart chart) : chart_(std::move(chart)) {}
    Chart chart_;
};

class AxisStage
{
   public:
    AxisStage axis(Axis axis) &&;
    // Axis ticked from the chart's domain.
    AxisStage axis(std::string name, Edge edge) &&;
    PlotStage plot(Plot plot) &&;
    Chart     build() &&;

   private:
    friend class TitleStage;
    explicit AxisStage(Chart chart) : chart_(std::move(chart)) {}
    Chart chart_;
};

class TitleStage
{
   public:
    TitleStage title(Title title) &&;
    AxisStage  axis(Axis axis) &&;
    AxisStage  axis(std::string name, Edge edge) &&;
    PlotStage  plot(Plot plot) &&;
    Chart      build() &&;

   private:
    friend class ChartBuilder;
    explicit TitleStage(Chart chart) : chart_(std::move(chart)) {}
    Chart chart_;
};

class ChartBuilder
{
   public:
    ChartBuilder aspect_ratio(AspectRatio aspect) &&;
    ChartBuilder layout(const LayoutConfig& config) &&;
    TitleStage   domain(Domain domain) &&;

   private:
    friend class Chart;
    ChartBuilder() = default;
    Chart chart_;
};

}   // namespace vellum
