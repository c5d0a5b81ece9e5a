#include <array>
#include <utility>
#include <vector>
#include <vellum/vellum.hpp>

using namespace vellum;

int main()
{
    Logger::instance().configure({.level = LogLevel::Info});

    // Any pair-like or parallel-array data converts once up front.
    std::vector<std::pair<int, int>> rain_pairs = {{13, 74}, {111, 37}, {125, 52}, {190, 66}};
    std::vector<Point>               rain       = to_points(rain_pairs);

    std::vector<float> snow_x = {22, 105, 120, 180, 210};
    std::vector<float> snow_y = {50, 44, 67, 39, 43};
    std::vector<Point> snow   = to_points(snow_x, snow_y);

    std::vector<std::array<double, 2>> hail_rows = {{{40, 45}}, {{95, 60}}, {{160, 55}}};
    std::vector<Point>                 hail      = to_points(hail_rows);

    Domain domain = Domain::from_data(rain);
    domain.including(snow).including(hail);

    Chart chart = Chart::builder()
                      .aspect_ratio(AspectRatio::Portrait)
                      .domain(domain)
                      .title(Title("Scatter Plot"))
                      .axis("", Edge::Bottom)
                      .axis("", Edge::Left)
                      .plot(Plot::scatter("Rain", rain))
                      .plot(Plot::scatter("Snow", snow))
                      .plot(Plot::scatter("Hail", hail).label())
                      .build();

    return SvgExporter::write_svg("scatter.svg", chart) ? 0 : 1;
}
