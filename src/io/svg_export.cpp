#include <cstddef>
#include <fstream>
#include <sstream>
#include <vellum/chart.hpp>
#include <vellum/color.hpp>
#include <vellum/export.hpp>
#include <vellum/logger.hpp>

#include "svg_writer.hpp"

namespace vellum
{

std::string xml_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string path_data(const std::vector<PathCommand>& cmds)
{
    std::ostringstream d;
    for (size_t i = 0; i < cmds.size(); ++i)
    {
        if (i > 0)
            d << ' ';
        const PathCommand& c = cmds[i];
        switch (c.op)
        {
            case PathOp::Move:
                d << 'M' << c.x << ' ' << c.y;
                break;
            case PathOp::Line:
                d << 'L' << c.x << ' ' << c.y;
                break;
            case PathOp::Close:
                d << 'Z';
                break;
        }
    }
    return d.str();
}

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

bool has_markers(PlotKind kind)
{
    return kind != PlotKind::Area;
}

std::string plot_class(const PlacedPlot& p)
{
    return "plot-" + std::to_string(style_class_for_series(p.num)) + " plot-"
           + plot_kind_name(p.plot.kind());
}

std::string marker_id(const SvgOptions& opt, size_t num)
{
    return opt.id_prefix + "marker-" + std::to_string(num);
}

std::string clip_id(const SvgOptions& opt)
{
    return opt.id_prefix + "clip-chart";
}

// "translate(x y) rotate(r)"; rotation only when nonzero
std::string text_transform(const TextFrame& f)
{
    std::ostringstream t;
    t << "translate(" << f.x << ' ' << f.y << ')';
    if (f.rotation != 0)
        t << " rotate(" << f.rotation << ')';
    return t.str();
}

void emit_defs(std::ostringstream& svg, const Chart& chart, const SvgOptions& opt)
{
    const Rect& area = chart.plot_area();

    svg << "  <defs>\n";
    for (const PlacedPlot& p : chart.plots())
    {
        if (!has_markers(p.plot.kind()))
            continue;
        svg << "    <marker id='" << marker_id(opt, p.num) << "' class='marker plot-"
            << style_class_for_series(p.num)
            << "' viewBox='-1 -1 2 2' markerWidth='5' markerHeight='5'>"
            << marker_glyph(marker_for_series(p.num)) << "</marker>\n";
    }
    svg << "    <clipPath id='" << clip_id(opt) << "'>\n";
    svg << "      <rect x='" << area.x << "' y='" << area.y << "' width='" << area.width
        << "' height='" << area.height << "' />\n";
    svg << "    </clipPath>\n";
    svg << "  </defs>\n";
}

void emit_titles(std::ostringstream& svg, const Chart& chart)
{
    for (const PlacedTitle& t : chart.titles())
    {
        TextFrame f = t.title.frame(t.band);
        svg << "  <text class='title' text-anchor='" << anchor_name(f.anchor) << "' transform='"
            << text_transform(f) << "'><tspan dy='0.33em'>" << xml_escape(t.title.text())
            << "</tspan></text>\n";
    }
}

void emit_grid(std::ostringstream& svg, const Chart& chart)
{
    auto emit = [&](const std::vector<Segment>& lines, const char* cls)
    {
        if (lines.empty())
            return;
        svg << "  <path class='" << cls << "' d='";
        for (size_t i = 0; i < lines.size(); ++i)
        {
            const Segment& s = lines[i];
            if (i > 0)
                svg << ' ';
            if (s.dx == 0)
                svg << 'M' << s.x << ' ' << s.y << " v" << s.dy;
            else
                svg << 'M' << s.x << ' ' << s.y << " h" << s.dx;
        }
        svg << "' />\n";
    };
    emit(chart.grid_lines(true), "grid-x");
    emit(chart.grid_lines(false), "grid-y");
}

void emit_axis(std::ostringstream& svg, const AxisGeometry& geo, const std::string& name)
{
    const bool horizontal = is_horizontal(geo.edge);

    svg << "  <g class='axis axis-" << edge_name(geo.edge) << "'>\n";

    svg << "    <path class='axis-line' d='M" << geo.line.x << ' ' << geo.line.y;
    if (horizontal)
        svg << " h" << geo.line.dx;
    else
        svg << " v" << geo.line.dy;
    svg << "' />\n";

    if (!geo.tick_marks.empty())
    {
        svg << "    <path class='axis-tick' d='";
        for (size_t i = 0; i < geo.tick_marks.size(); ++i)
        {
            const Segment& s = geo.tick_marks[i];
            if (i > 0)
                svg << ' ';
            svg << 'M' << s.x << ' ' << s.y;
            if (horizontal)
                svg << " v" << s.dy;
            else
                svg << " h" << s.dx;
        }
        svg << "' />\n";
    }

    if (!geo.labels.empty())
    {
        svg << "    <text class='tick' text-anchor='" << anchor_name(geo.label_anchor) << "'>\n";
        for (const TextPlacement& l : geo.labels)
        {
            svg << "      <tspan x='" << l.x << "' y='" << l.y << "' dy='0.33em'>"
                << xml_escape(l.text) << "</tspan>\n";
        }
        svg << "    </text>\n";
    }

    if (geo.name_rect)
    {
        TextFrame f = text_frame(geo.edge, Anchor::Middle, *geo.name_rect);
        svg << "    <text class='axis-name' text-anchor='middle' transform='" << text_transform(f)
            << "'><tspan dy='0.33em'>" << xml_escape(name) << "</tspan></text>\n";
    }

    svg << "  </g>\n";
}

void emit_plot(std::ostringstream& svg, const PlacedPlot& p, const SvgOptions& opt)
{
    std::vector<PathCommand> cmds = p.plot.path(p.bound);
    if (cmds.empty())
        return;

    svg << "    <path class='" << plot_class(p) << "' d='" << path_data(cmds) << "'";
    if (has_markers(p.plot.kind()))
    {
        std::string url = "url(#" + marker_id(opt, p.num) + ")";
        svg << " marker-start='" << url << "' marker-mid='" << url << "' marker-end='" << url
            << "'";
    }
    svg << " />\n";
}

void emit_point_labels(std::ostringstream& svg, const PlacedPlot& p)
{
    std::vector<TextPlacement> labels = p.plot.point_labels(p.bound);
    if (labels.empty())
        return;

    svg << "  <text class='point-label plot-" << style_class_for_series(p.num)
        << "' text-anchor='middle'>\n";
    for (const TextPlacement& l : labels)
    {
        svg << "    <tspan x='" << l.x << "' y='" << l.y << "' dy='-0.66em'>" << xml_escape(l.text)
            << "</tspan>\n";
    }
    svg << "  </text>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::stylesheet()
{
    std::ostringstream css;
    css << "svg.chart { background-color: #fff; font-family: sans-serif; font-size: 40px; }\n";
    css << ".title { font-size: 56px; fill: " << to_hex(palette::foreground) << "; }\n";
    css << ".axis-line, .axis-tick { fill: none; stroke: " << to_hex(palette::foreground)
        << "; stroke-width: 2; }\n";
    css << ".tick, .axis-name { fill: " << to_hex(palette::foreground) << "; }\n";
    css << ".axis-name { font-size: 48px; }\n";
    css << ".grid-x, .grid-y { fill: none; stroke: " << to_hex(palette::grid)
        << "; stroke-width: 2; }\n";
    for (size_t i = 0; i < palette::default_cycle_size; ++i)
    {
        std::string hex = to_hex(palette::default_cycle[i]);
        css << ".plot-" << i << " { fill: " << hex << "; stroke: " << hex << "; }\n";
    }
    css << ".plot-line { fill: none; stroke-width: 6; }\n";
    css << ".plot-area { stroke: none; fill-opacity: 0.5; }\n";
    css << ".plot-scatter { fill: none; stroke: none; }\n";
    css << ".marker { stroke: none; }\n";
    css << ".point-label { font-size: 32px; stroke: none; }\n";
    return css.str();
}

std::string SvgExporter::to_string(const Chart& chart, const SvgOptions& options)
{
    const Rect canvas = chart.canvas();

    std::ostringstream svg;
    if (options.standalone)
    {
        svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        svg << "<svg xmlns='http://www.w3.org/2000/svg' class='chart' width='" << canvas.width
            << "' height='" << canvas.height << "' viewBox='0 0 " << canvas.width << ' '
            << canvas.height << "'>\n";
        svg << "<style>\n" << stylesheet() << "</style>\n";
    }
    else
    {
        svg << "<svg class='chart' viewBox='0 0 " << canvas.width << ' ' << canvas.height
            << "'>\n";
    }

    emit_defs(svg, chart, options);
    emit_titles(svg, chart);
    emit_grid(svg, chart);
    for (size_t i = 0; i < chart.axes().size(); ++i)
        emit_axis(svg, chart.axis_geometry(i), chart.axes()[i].axis.name());

    svg << "  <g clip-path='url(#" << clip_id(options) << ")'>\n";
    for (const PlacedPlot& p : chart.plots())
        emit_plot(svg, p, options);
    svg << "  </g>\n";

    for (const PlacedPlot& p : chart.plots())
        emit_point_labels(svg, p);

    svg << "</svg>\n";

    VELLUM_LOG_DEBUG("export",
                     "serialized chart: {} titles, {} axes, {} plots",
                     chart.titles().size(),
                     chart.axes().size(),
                     chart.plots().size());
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, const Chart& chart, const SvgOptions& options)
{
    std::string content = to_string(chart, options);

    std::ofstream file(path);
    if (!file.is_open())
    {
        VELLUM_LOG_ERROR("export", "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        VELLUM_LOG_ERROR("export", "failed writing SVG to '{}'", path);
        return false;
    }
    return true;
}

}   // namespace vellum
