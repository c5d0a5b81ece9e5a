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
                      .domain(domain)
                      .title(Title("Area Plot"))
                      .axis("", Edge::Bottom)
                      .axis("", Edge::Left)
                      .axis("", Edge::Right)
                      .plot(Plot::area("Rain", rain))
                      .plot(Plot::area("Snow", snow))
                      .build();

    return SvgExporter::write_svg("area.svg", chart) ? 0 : 1;
}
