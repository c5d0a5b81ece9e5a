#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <vellum/chart.hpp>

namespace vellum
{

// HTML document holding one or more charts, each followed by a legend of
// its named series.  One stylesheet in the head serves every chart.
class Page
{
   public:
    Page() = default;

    // Appended in order.  The chart keeps borrowing its plots' data, which
    // must outlive the page.
    Page& chart(Chart chart);

    size_t chart_count() const { return charts_.size(); }

    std::string to_html() const;

    // Returns false and logs on I/O failure.
    bool write_html(const std::string& path) const;

   private:
    std::vector<Chart> charts_;
};

}   // namespace vellum
