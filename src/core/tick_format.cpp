#include "tick_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace vellum
{

namespace
{

void trim_decimals(std::string& str, int keep)
{
    auto dot = str.find('.');
    if (dot == std::string::npos)
        return;
    size_t decimals = str.size() - dot - 1;
    while (decimals > static_cast<size_t>(keep) && str.back() == '0')
    {
        str.pop_back();
        --decimals;
    }
    if (str.back() == '.')
        str.pop_back();
}

// Decimals needed to print the mantissa of `spacing` (1 for 2.5e8).
int mantissa_decimals(double spacing, int exponent)
{
    double mantissa = spacing / std::pow(10.0, exponent);
    for (int d = 0; d < 6; ++d)
    {
        double scaled = mantissa * std::pow(10.0, d);
        if (std::abs(scaled - std::round(scaled)) < 1e-4 * scaled)
            return d;
    }
    return 6;
}

}   // anonymous namespace

std::string format_tick_value(double value, double spacing, double magnitude)
{
    char   buf[64];
    double abs_spacing = std::abs(spacing);

    if (abs_spacing > 0.0 && std::abs(value) < abs_spacing * 1e-6)
        return "0";
    if (value == 0.0)
        return "0";

    double abs_val = std::abs(value);
    double abs_mag = std::max(std::abs(magnitude), abs_val);

    // One digit past the spacing's leading decimal, so 0.25 keeps "0.25"
    // while its neighbour 0.5 trims back to "0.5".
    // The small bias keeps 0.01f (slightly below 0.01) at two decimals.
    int digits = 0;
    int keep   = 0;
    if (abs_spacing > 0.0 && std::isfinite(abs_spacing))
    {
        int exponent = static_cast<int>(std::ceil(-std::log10(abs_spacing) - 1e-6));
        keep         = std::max(0, exponent);
        digits       = std::max(0, exponent + 1);
    }

    if (digits <= 9 && abs_mag < 1e9 && abs_mag >= 0.001)
    {
        std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
        std::string str(buf);
        trim_decimals(str, keep);
        return str;
    }

    // Mantissa decimals: the decades between the value and the spacing,
    // plus whatever the spacing's own mantissa needs (2.5e8 needs one).
    int decimals = 3;
    if (abs_spacing > 0.0 && std::isfinite(abs_spacing))
    {
        int value_exp   = static_cast<int>(std::floor(std::log10(abs_val) + 1e-6));
        int spacing_exp = static_cast<int>(std::floor(std::log10(abs_spacing) + 1e-6));
        decimals        = value_exp - spacing_exp + mantissa_decimals(abs_spacing, spacing_exp);
        decimals        = std::clamp(decimals, 0, 15);
    }
    std::snprintf(buf, sizeof(buf), "%.*e", decimals, value);
    return buf;
}

std::string format_data_value(float value)
{
    if (value == 0.0f)
        return "0";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(value));
    return buf;
}

}   // namespace vellum
