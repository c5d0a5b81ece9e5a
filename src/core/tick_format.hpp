#pragma once

#include <string>

namespace vellum
{

// Label for a tick at `value` on an axis whose ticks are `spacing` apart.
// Uses just enough decimals to tell neighbouring ticks apart, trims
// redundant zeros and never prints "-0".  `magnitude` is the largest
// absolute value on the axis; it alone decides between fixed and
// scientific notation, so every label of one axis uses the same one.
std::string format_tick_value(double value, double spacing, double magnitude);

// Compact label for a raw data value (point labels): up to six
// significant digits, no trailing zeros.
std::string format_data_value(float value);

}   // namespace vellum
