#include <vector>
#include <vellum/vellum.hpp>

using namespace vellum;

int main()
{
    Logger::instance().configure({.level = LogLevel::Info});

    std::vector<Point> rain = {{13, 74}, {111, 37}, {125, 52}, {190, 66}};
    std::vector<Point> snow = {{22, 50}, {105, 44}, {120, 67}, {180, 39}, {210, 43}};

    Domain domain = Domain::from_data(rain);
    domain.including(snow);

    Chart chart = Chart::builder()
                      .aspect_ratio(AspectRatio::Square)
                      .domain(domain)
                      .title(Title("Line Plot"))
                      .title(Title("Precipitation by month").at_start().on_edge(Edge::Bottom))
                      .axis("Month", Edge::Bottom)
                      .axis("mm", Edge::Left)
                      .plot(Plot::line("Rain", rain).label())
                      .plot(Plot::line("Snow", snow))
                      .build();

    return SvgExporter::write_svg("line.svg", chart) ? 0 : 1;
}
