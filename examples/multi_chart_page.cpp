#include <cmath>
#include <vector>
#include <vellum/vellum.hpp>

using namespace vellum;

int main()
{
    Logger::instance().configure({.level = LogLevel::Debug, .file_path = "vellum_page.log"});

    std::vector<Point> wave;
    for (int i = 0; i <= 60; ++i)
    {
        float t = static_cast<float>(i) * 0.1f;
        wave.push_back({t, std::sin(t) * 3.0f});
    }
    std::vector<Point> rain = {{13, 74}, {111, 37}, {125, 52}, {190, 66}};

    LayoutConfig compact;
    compact.margin    = 20;
    compact.show_grid = false;

    Page page;
    page.chart(Chart::builder()
                   .domain(Domain::from_data(wave))
                   .title(Title("Sine"))
                   .axis("t", Edge::Bottom)
                   .axis("", Edge::Left)
                   .plot(Plot::area("3 sin t", wave))
                   .build());
    page.chart(Chart::builder()
                   .aspect_ratio(AspectRatio::Square)
                   .layout(compact)
                   .domain(Domain::from_data(rain))
                   .title(Title("Rainfall").at_end())
                   .axis("", Edge::Top)
                   .axis("", Edge::Right)
                   .plot(Plot::line("2024", rain))
                   .plot(Plot::scatter("samples", rain).label())
                   .build());

    if (!page.write_html("charts.html"))
        return 1;
    VELLUM_LOG_INFO("example", "wrote {} charts to charts.html", page.chart_count());
    return 0;
}
