#include <gtest/gtest.h>
#include <string>

#include "core/tick_format.hpp"

using namespace vellum;

// --- Tick labels ---

TEST(TickFormat, ZeroAndNearZero)
{
    EXPECT_EQ(format_tick_value(0.0, 1.0, 10.0), "0");
    EXPECT_EQ(format_tick_value(1e-12, 1.0, 10.0), "0");
    EXPECT_EQ(format_tick_value(-1e-12, 0.1, 1.0), "0");
}

TEST(TickFormat, WholeNumbersDropDecimals)
{
    EXPECT_EQ(format_tick_value(3.0, 1.0, 10.0), "3");
    EXPECT_EQ(format_tick_value(150.0, 25.0, 200.0), "150");
    EXPECT_EQ(format_tick_value(-5.0, 5.0, 5.0), "-5");
}

TEST(TickFormat, DecimalsFollowSpacing)
{
    EXPECT_EQ(format_tick_value(0.5, 0.1, 1.0), "0.5");
    EXPECT_EQ(format_tick_value(1.0, 0.1, 1.0), "1.0");
    EXPECT_EQ(format_tick_value(0.25, 0.25, 1.5), "0.25");
    EXPECT_EQ(format_tick_value(0.03, 0.01, 0.1), "0.03");
}

TEST(TickFormat, SinglePrecisionSpacing)
{
    // 0.01f sits just below 0.01 and must not gain a third decimal
    EXPECT_EQ(format_tick_value(0.05f, 0.01f, 0.1), "0.05");
    EXPECT_EQ(format_tick_value(0.3f, 0.1f, 1.0), "0.3");
}

TEST(TickFormat, LargeMagnitudeUsesScientific)
{
    EXPECT_EQ(format_tick_value(1e10, 1e9, 1e10), "1.0e+10");
    EXPECT_EQ(format_tick_value(-1.5e9, 5e8, 2e9), "-1.5e+09");
}

TEST(TickFormat, MantissaKeepsSpacingDigits)
{
    // Quarter steps of 1e9: 1.25e9 must not round to 1.2e+09
    EXPECT_EQ(format_tick_value(2.5e8, 2.5e8, 2e9), "2.5e+08");
    EXPECT_EQ(format_tick_value(1.25e9, 2.5e8, 2e9), "1.25e+09");
    EXPECT_EQ(format_tick_value(1.75e9, 2.5e8, 2e9), "1.75e+09");
    EXPECT_EQ(format_tick_value(2e9, 2.5e8, 2e9), "2.00e+09");
}

TEST(TickFormat, AxisMagnitudeChoosesNotation)
{
    // Same value and spacing; only the axis extent differs
    EXPECT_EQ(format_tick_value(2e8, 1e8, 9e8), "200000000");
    EXPECT_EQ(format_tick_value(2e8, 1e8, 1e9), "2e+08");

    EXPECT_EQ(format_tick_value(1e-4, 1e-4, 1e-3), "0.0001");
    EXPECT_EQ(format_tick_value(1e-3, 1e-4, 1e-3), "0.0010");
    EXPECT_EQ(format_tick_value(2e-4, 1e-4, 5e-4), "2e-04");
}

// --- Data labels ---

TEST(DataFormat, CompactValues)
{
    EXPECT_EQ(format_data_value(0.0f), "0");
    EXPECT_EQ(format_data_value(13.0f), "13");
    EXPECT_EQ(format_data_value(37.5f), "37.5");
    EXPECT_EQ(format_data_value(0.1f), "0.1");
    EXPECT_EQ(format_data_value(-2.25f), "-2.25");
}
