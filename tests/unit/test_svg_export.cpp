#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include <vellum/chart.hpp>
#include <vellum/export.hpp>

#include "io/svg_writer.hpp"

namespace vellum
{
namespace
{

const std::vector<Point> rainfall = {{13, 74}, {111, 37}, {125, 52}, {190, 66}};
const std::vector<Point> snowfall = {{22, 50}, {105, 44}, {120, 67}, {180, 39}, {210, 43}};

Chart make_chart(const LayoutConfig& cfg = {})
{
    Domain domain = Domain::from_data(rainfall);
    domain.including(snowfall);

    Plot snow = Plot::scatter("Snow", snowfall);
    snow.label();

    return Chart::builder()
        .layout(cfg)
        .domain(domain)
        .title(Title("Rain <&> Snow"))
        .axis("Month", Edge::Bottom)
        .axis("", Edge::Left)
        .plot(Plot::area("Rain", rainfall))
        .plot(Plot::line("Trend", rainfall))
        .plot(snow)
        .build();
}

size_t count(const std::string& haystack, const std::string& needle)
{
    size_t n   = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos)
    {
        ++n;
        pos += needle.size();
    }
    return n;
}

}   // anonymous namespace

TEST(SvgExport, StandaloneDocument)
{
    std::string svg = SvgExporter::to_string(make_chart());
    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("xmlns='http://www.w3.org/2000/svg'"), std::string::npos);
    EXPECT_NE(svg.find("viewBox='0 0 2000 1500'"), std::string::npos);
    EXPECT_NE(svg.find("<style>"), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST(SvgExport, InlineDocumentHasNoPrologOrStyle)
{
    SvgOptions opt;
    opt.standalone  = false;
    std::string svg = SvgExporter::to_string(make_chart(), opt);
    EXPECT_EQ(svg.rfind("<svg", 0), 0u);
    EXPECT_EQ(svg.find("<?xml"), std::string::npos);
    EXPECT_EQ(svg.find("<style>"), std::string::npos);
}

TEST(SvgExport, ClipPathCoversPlotArea)
{
    Chart       chart = make_chart();
    std::string svg   = SvgExporter::to_string(chart);
    const Rect& a     = chart.plot_area();

    std::ostringstream rect;
    rect << "<rect x='" << a.x << "' y='" << a.y << "' width='" << a.width << "' height='"
         << a.height << "' />";
    EXPECT_NE(svg.find("<clipPath id='clip-chart'>"), std::string::npos);
    EXPECT_NE(svg.find(rect.str()), std::string::npos);
    EXPECT_NE(svg.find("clip-path='url(#clip-chart)'"), std::string::npos);
}

TEST(SvgExport, IdPrefixAppliesToAllIds)
{
    SvgOptions opt;
    opt.id_prefix   = "c1-";
    std::string svg = SvgExporter::to_string(make_chart(), opt);
    EXPECT_NE(svg.find("id='c1-clip-chart'"), std::string::npos);
    EXPECT_NE(svg.find("id='c1-marker-1'"), std::string::npos);
    EXPECT_NE(svg.find("url(#c1-marker-2)"), std::string::npos);
    EXPECT_EQ(svg.find("id='clip-chart'"), std::string::npos);
}

TEST(SvgExport, PlotClassesAndMarkers)
{
    std::string svg = SvgExporter::to_string(make_chart());
    EXPECT_NE(svg.find("class='plot-0 plot-area'"), std::string::npos);
    EXPECT_NE(svg.find("class='plot-1 plot-line'"), std::string::npos);
    EXPECT_NE(svg.find("class='plot-2 plot-scatter'"), std::string::npos);

    // Areas carry no markers; lines and scatters use their own.
    EXPECT_EQ(svg.find("id='marker-0'"), std::string::npos);
    EXPECT_NE(svg.find("id='marker-1'"), std::string::npos);
    EXPECT_NE(svg.find("marker-mid='url(#marker-2)'"), std::string::npos);
    EXPECT_NE(svg.find("<rect x='-1' y='-1' width='2' height='2' />"), std::string::npos);
}

TEST(SvgExport, TitleIsEscaped)
{
    std::string svg = SvgExporter::to_string(make_chart());
    EXPECT_NE(svg.find("Rain &lt;&amp;&gt; Snow"), std::string::npos);
    EXPECT_EQ(svg.find("Rain <&> Snow"), std::string::npos);
}

TEST(SvgExport, AxesAndNames)
{
    std::string svg = SvgExporter::to_string(make_chart());
    EXPECT_NE(svg.find("class='axis axis-bottom'"), std::string::npos);
    EXPECT_NE(svg.find("class='axis axis-left'"), std::string::npos);
    EXPECT_NE(svg.find(">Month</tspan>"), std::string::npos);
    EXPECT_NE(svg.find("text-anchor='end'"), std::string::npos);
    EXPECT_EQ(count(svg, "class='axis-name'"), 1u);
}

TEST(SvgExport, GridFollowsConfig)
{
    std::string with = SvgExporter::to_string(make_chart());
    EXPECT_NE(with.find("class='grid-x'"), std::string::npos);
    EXPECT_NE(with.find("class='grid-y'"), std::string::npos);

    LayoutConfig cfg;
    cfg.show_grid       = false;
    std::string without = SvgExporter::to_string(make_chart(cfg));
    EXPECT_EQ(without.find("class='grid-x'"), std::string::npos);
}

TEST(SvgExport, PointLabelsOnlyForLabeledPlots)
{
    std::string svg = SvgExporter::to_string(make_chart());
    EXPECT_EQ(count(svg, "dy='-0.66em'"), snowfall.size());
    EXPECT_NE(svg.find(">(22 50)</tspan>"), std::string::npos);
}

TEST(SvgExport, StylesheetCoversPalette)
{
    std::string css = SvgExporter::stylesheet();
    for (int i = 0; i < 10; ++i)
        EXPECT_NE(css.find(".plot-" + std::to_string(i) + " {"), std::string::npos) << i;
    EXPECT_NE(css.find("#1f77b4"), std::string::npos);
}

TEST(SvgExport, WriteSvgRoundTripsToDisk)
{
    Chart chart = make_chart();
    auto  path  = std::filesystem::temp_directory_path() / "vellum_test_export.svg";

    ASSERT_TRUE(SvgExporter::write_svg(path.string(), chart));

    std::ifstream     in(path);
    std::stringstream buf;
    buf << in.rdbuf();
    EXPECT_EQ(buf.str(), SvgExporter::to_string(chart));
    std::filesystem::remove(path);
}

TEST(SvgExport, WriteSvgFailsOnBadPath)
{
    EXPECT_FALSE(SvgExporter::write_svg("/nonexistent-dir/sub/out.svg", make_chart()));
}

// --- Path data ---

TEST(SvgWriter, PathData)
{
    std::vector<PathCommand> cmds = {
        {PathOp::Move, 1, 2}, {PathOp::Line, 3, -4}, {PathOp::Close, 1, 2}};
    EXPECT_EQ(path_data(cmds), "M1 2 L3 -4 Z");
    EXPECT_EQ(path_data({}), "");
}

TEST(SvgWriter, XmlEscape)
{
    EXPECT_EQ(xml_escape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    EXPECT_EQ(xml_escape("plain"), "plain");
}

}   // namespace vellum
