#include <vellum/layout.hpp>

namespace vellum
{

TextFrame text_frame(Edge edge, Anchor anchor, const Rect& band)
{
    TextFrame f;
    f.anchor = anchor;

    const int32_t center_x = band.x + static_cast<int32_t>(band.width) / 2;
    const int32_t center_y = band.y + static_cast<int32_t>(band.height) / 2;

    if (is_horizontal(edge))
    {
        switch (anchor)
        {
            case Anchor::Start:
                f.x = band.x;
                break;
            case Anchor::End:
                f.x = band.right();
                break;
            case Anchor::Middle:
                f.x = center_x;
                break;
        }
        f.y = center_y;
        return f;
    }

    // Rotated text runs along y: on the left edge it reads bottom-to-top,
    // so its start sits at the bottom; on the right edge the reverse.
    f.x        = center_x;
    f.rotation = (edge == Edge::Left) ? -90 : 90;
    bool at_top = (edge == Edge::Left && anchor == Anchor::End)
               || (edge == Edge::Right && anchor == Anchor::Start);
    bool at_bottom = (edge == Edge::Left && anchor == Anchor::Start)
                  || (edge == Edge::Right && anchor == Anchor::End);
    if (at_top)
        f.y = band.y;
    else if (at_bottom)
        f.y = band.bottom();
    else
        f.y = center_y;
    return f;
}

}   // namespace vellum
