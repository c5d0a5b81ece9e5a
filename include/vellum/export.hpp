#pragma once

#include <string>

namespace vellum
{

class Chart;

struct SvgOptions
{
    // Full document: XML prolog, xmlns, pixel size and an embedded
    // stylesheet.  Off for charts inlined into an HTML page that carries
    // the stylesheet itself.
    bool standalone = true;

    // Prepended to marker and clip-path ids so several charts can share
    // one document.
    std::string id_prefix;
};

class SvgExporter
{
   public:
    // Write a Chart to an SVG file.  Returns false and logs on I/O failure.
    static bool write_svg(const std::string& path, const Chart& chart, const SvgOptions& options = {});

    // Write SVG to a string instead of a file.
    static std::string to_string(const Chart& chart, const SvgOptions& options = {});

    // CSS for every class the exporter emits, series colors included.
    static std::string stylesheet();
};

}   // namespace vellum
