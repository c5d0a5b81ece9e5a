#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <vellum/plot.hpp>

namespace vellum
{

// Shared by the SVG and HTML writers.

// XML-escape a string for safe embedding in attributes and text content.
std::string xml_escape(std::string_view s);

// SVG path data ("M13 74 L111 37 Z") for a command list.
std::string path_data(const std::vector<PathCommand>& cmds);

}   // namespace vellum
