#pragma once

#include <vellum/axis.hpp>
#include <vellum/chart.hpp>
#include <vellum/color.hpp>
#include <vellum/domain.hpp>
#include <vellum/export.hpp>
#include <vellum/fwd.hpp>
#include <vellum/layout.hpp>
#include <vellum/logger.hpp>
#include <vellum/page.hpp>
#include <vellum/plot.hpp>
#include <vellum/point.hpp>
#include <vellum/rect.hpp>
#include <vellum/scale.hpp>
#include <vellum/title.hpp>

// ─── Quick Start ─────────────────────────────────────────────────────────────
//
//   std::vector<vellum::Point> pts = {{13, 74}, {111, 37}, {125, 52}, {190, 66}};
//   auto chart = vellum::Chart::builder()
//                    .domain(vellum::Domain::from_data(pts))
//                    .title(vellum::Title("Rainfall"))
//                    .axis("", vellum::Edge::Bottom)
//                    .axis("", vellum::Edge::Left)
//                    .plot(vellum::Plot::line("2024", pts))
//                    .build();
//   vellum::SvgExporter::write_svg("rain.svg", chart);
