#include <gtest/gtest.h>
#include <vellum/rect.hpp>

using namespace vellum;

// Helper: carved and remainder cover exactly the original area
static void expect_tiles(const Rect& original, const RectSplit& parts)
{
    EXPECT_EQ(static_cast<int>(parts.carved.width) * parts.carved.height
                  + static_cast<int>(parts.remainder.width) * parts.remainder.height,
              static_cast<int>(original.width) * original.height);
}

// --- split ---

TEST(RectSplit, Top)
{
    Rect      r(0, 0, 2000, 1500);
    RectSplit parts = r.split(Edge::Top, 100);
    EXPECT_EQ(parts.carved, Rect(0, 0, 2000, 100));
    EXPECT_EQ(parts.remainder, Rect(0, 100, 2000, 1400));
    expect_tiles(r, parts);
}

TEST(RectSplit, Bottom)
{
    Rect      r(40, 40, 1920, 1420);
    RectSplit parts = r.split(Edge::Bottom, 80);
    EXPECT_EQ(parts.carved, Rect(40, 1380, 1920, 80));
    EXPECT_EQ(parts.remainder, Rect(40, 40, 1920, 1340));
    expect_tiles(r, parts);
}

TEST(RectSplit, Left)
{
    Rect      r(10, 20, 300, 200);
    RectSplit parts = r.split(Edge::Left, 50);
    EXPECT_EQ(parts.carved, Rect(10, 20, 50, 200));
    EXPECT_EQ(parts.remainder, Rect(60, 20, 250, 200));
    expect_tiles(r, parts);
}

TEST(RectSplit, Right)
{
    Rect      r(10, 20, 300, 200);
    RectSplit parts = r.split(Edge::Right, 50);
    EXPECT_EQ(parts.carved, Rect(260, 20, 50, 200));
    EXPECT_EQ(parts.remainder, Rect(10, 20, 250, 200));
    expect_tiles(r, parts);
}

TEST(RectSplit, ExactFitLeavesEmptyRemainder)
{
    Rect      r(0, 0, 100, 80);
    RectSplit parts = r.split(Edge::Top, 80);
    EXPECT_EQ(parts.carved, r);
    EXPECT_TRUE(parts.remainder.empty());
    expect_tiles(r, parts);
}

TEST(RectSplit, OversizedCarvesNothing)
{
    Rect r(5, 5, 100, 60);
    for (Edge e : {Edge::Top, Edge::Left, Edge::Bottom, Edge::Right})
    {
        RectSplit parts = r.split(e, 200);
        EXPECT_EQ(parts.remainder, r) << edge_name(e);
        EXPECT_TRUE(parts.carved.empty()) << edge_name(e);
        expect_tiles(r, parts);
    }
}

TEST(RectSplit, TilesForEveryAmount)
{
    Rect r(0, 0, 37, 53);
    for (uint16_t v = 0; v <= 60; ++v)
    {
        for (Edge e : {Edge::Top, Edge::Left, Edge::Bottom, Edge::Right})
            expect_tiles(r, r.split(e, v));
    }
}

// --- inset ---

TEST(RectInset, ShrinksAllSides)
{
    EXPECT_EQ(Rect(0, 0, 2000, 1500).inset(40), Rect(40, 40, 1920, 1420));
}

TEST(RectInset, SaturatesAtZero)
{
    Rect r = Rect(0, 0, 50, 30).inset(20);
    EXPECT_EQ(r.width, 10);
    EXPECT_EQ(r.height, 0);
    EXPECT_TRUE(r.empty());
}

// --- intersect ---

TEST(RectIntersect, HorizontalClipsToOtherExtent)
{
    Rect band(40, 1380, 1920, 80);
    Rect plot(120, 140, 1840, 1240);
    EXPECT_EQ(band.intersect_horiz(plot), Rect(120, 1380, 1840, 80));
}

TEST(RectIntersect, VerticalClipsToOtherExtent)
{
    Rect band(40, 40, 80, 1420);
    Rect plot(120, 140, 1840, 1240);
    EXPECT_EQ(band.intersect_vert(plot), Rect(40, 140, 80, 1240));
}

TEST(RectIntersect, DisjointGivesZeroExtent)
{
    Rect a(0, 0, 10, 10);
    Rect b(50, 50, 10, 10);
    EXPECT_EQ(a.intersect_horiz(b).width, 0);
    EXPECT_EQ(a.intersect_vert(b).height, 0);
}

// --- canvases ---

TEST(AspectRatio, CanvasSizes)
{
    EXPECT_EQ(canvas_rect(AspectRatio::Landscape), Rect(0, 0, 2000, 1500));
    EXPECT_EQ(canvas_rect(AspectRatio::Square), Rect(0, 0, 2000, 2000));
    EXPECT_EQ(canvas_rect(AspectRatio::Portrait), Rect(0, 0, 1500, 2000));
}
