#include <fstream>
#include <sstream>
#include <utility>
#include <vellum/export.hpp>
#include <vellum/logger.hpp>
#include <vellum/page.hpp>

#include "svg_writer.hpp"

namespace vellum
{

namespace
{

const char* page_css = ".charts { display: flex; flex-wrap: wrap; }\n"
                       ".chart { flex: 1 1 40em; margin: 1em; }\n"
                       ".legend { display: flex; flex-wrap: wrap; font-family: sans-serif; }\n"
                       ".legend-entry { display: flex; align-items: center; margin: 0 1em; }\n"
                       ".legend-entry svg { width: 1em; height: 1em; margin-right: 0.4em; }\n";

void emit_legend(std::ostringstream& html, const Chart& chart)
{
    bool any = false;
    for (const PlacedPlot& p : chart.plots())
        any = any || !p.plot.name().empty();
    if (!any)
        return;

    html << "<div class='legend'>\n";
    for (const PlacedPlot& p : chart.plots())
    {
        if (p.plot.name().empty())
            continue;
        html << "<div class='legend-entry'><svg viewBox='-1.5 -1.5 3 3' class='marker plot-"
             << style_class_for_series(p.num) << "'>" << marker_glyph(marker_for_series(p.num))
             << "</svg><span>" << xml_escape(p.plot.name()) << "</span></div>\n";
    }
    html << "</div>\n";
}

}   // anonymous namespace

Page& Page::chart(Chart chart)
{
    charts_.push_back(std::move(chart));
    return *this;
}

std::string Page::to_html() const
{
    std::ostringstream html;
    html << "<!DOCTYPE html>\n";
    html << "<html>\n<head>\n<meta charset='utf-8'>\n";
    html << "<style>\n" << SvgExporter::stylesheet() << page_css << "</style>\n";
    html << "</head>\n<body>\n<div class='charts'>\n";

    for (size_t i = 0; i < charts_.size(); ++i)
    {
        SvgOptions opt;
        opt.standalone = false;
        opt.id_prefix  = "c" + std::to_string(i) + "-";

        html << "<div class='chart'>\n";
        html << SvgExporter::to_string(charts_[i], opt);
        emit_legend(html, charts_[i]);
        html << "</div>\n";
    }

    html << "</div>\n</body>\n</html>\n";
    VELLUM_LOG_DEBUG("page", "rendered page with {} charts", charts_.size());
    return html.str();
}

bool Page::write_html(const std::string& path) const
{
    std::string content = to_html();

    std::ofstream file(path);
    if (!file.is_open())
    {
        VELLUM_LOG_ERROR("page", "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        VELLUM_LOG_ERROR("page", "failed writing HTML to '{}'", path);
        return false;
    }
    return true;
}

}   // namespace vellum
