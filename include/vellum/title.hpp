#pragma once

#include <string>
#include <vellum/layout.hpp>
#include <vellum/rect.hpp>

namespace vellum
{

// Chart title text placed in its own band on one edge of the canvas.
class Title
{
   public:
    explicit Title(std::string text);

    // Builder-style modifiers on temporaries, e.g.
    //   Title("Rainfall").at_start().on_edge(Edge::Bottom)
    Title at_start() &&;
    Title at_end() &&;
    Title on_edge(Edge edge) &&;

    const std::string& text() const { return text_; }
    Anchor             anchor() const { return anchor_; }
    Edge               edge() const { return edge_; }

    RectSplit reserve(const Rect& area, const LayoutConfig& config) const;

    // Anchor point and rotation of the text inside its band.
    TextFrame frame(const Rect& band) const;

   private:
    std::string text_;
    Anchor      anchor_ = Anchor::Middle;
    Edge        edge_   = Edge::Top;
};

}   // namespace vellum
