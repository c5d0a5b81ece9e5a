#include <utility>
#include <vellum/title.hpp>

namespace vellum
{

Title::Title(std::string text) : text_(std::move(text)) {}

Title Title::at_start() &&
{
    anchor_ = Anchor::Start;
    return std::move(*this);
}

Title Title::at_end() &&
{
    anchor_ = Anchor::End;
    return std::move(*this);
}

Title Title::on_edge(Edge edge) &&
{
    edge_ = edge;
    return std::move(*this);
}

RectSplit Title::reserve(const Rect& area, const LayoutConfig& config) const
{
    return area.split(edge_, config.title_space);
}

TextFrame Title::frame(const Rect& band) const
{
    return text_frame(edge_, anchor_, band);
}

}   // namespace vellum
