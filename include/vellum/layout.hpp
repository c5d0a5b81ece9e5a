#pragma once

#include <cstdint>
#include <vellum/rect.hpp>

namespace vellum
{

// Pixel budgets for carving a chart canvas. Defaults suit the 2000 px
// canvases of AspectRatio.
struct LayoutConfig
{
    uint16_t margin               = 40;    // inset on every side of the canvas
    uint16_t title_space          = 100;   // band reserved per title
    uint16_t axis_space           = 80;    // band reserved per unnamed axis
    uint16_t named_axis_space     = 160;   // band reserved per named axis
    int32_t  tick_length          = 20;
    int32_t  label_gap_horizontal = 28;   // tick label offset from a vertical axis line
    int32_t  label_gap_vertical   = 40;   // tick label offset from a horizontal axis line
    bool     show_grid            = true;
};

enum class Anchor : uint8_t
{
    Start,
    Middle,
    End,
};

constexpr const char* anchor_name(Anchor a)
{
    switch (a)
    {
        case Anchor::Start:
            return "start";
        case Anchor::Middle:
            return "middle";
        case Anchor::End:
            return "end";
    }
    return "middle";
}

// Where a block of text sits inside a band on `edge`: its anchor point and
// the rotation that keeps it reading along the band (-90 on the left edge,
// 90 on the right).
struct TextFrame
{
    int32_t x        = 0;
    int32_t y        = 0;
    int     rotation = 0;
    Anchor  anchor   = Anchor::Middle;
};

TextFrame text_frame(Edge edge, Anchor anchor, const Rect& band);

}   // namespace vellum
