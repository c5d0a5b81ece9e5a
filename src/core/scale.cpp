#include <algorithm>
#include <cfloat>
#include <cmath>
#include <utility>
#include <vellum/logger.hpp>
#include <vellum/scale.hpp>

#include "tick_format.hpp"

namespace vellum
{

namespace
{

float power_of_ten(int exponent)
{
    return static_cast<float>(std::pow(10.0, exponent));
}

// Upper bound on tick intervals; a fitted scale never comes close.
constexpr double kMaxIntervals = 1000.0;

// Coarse spacing 10^floor(log10(span)), refined by how many coarse steps
// the containing range spans.  The span and the containing multiples are
// taken in double: two finite floats near FLT_MAX can be more than FLT_MAX
// apart.
float nice_spacing(float min, float max)
{
    double span = static_cast<double>(max) - static_cast<double>(min);
    double lg   = std::log10(span);
    if (!std::isfinite(lg))
        return 0.0f;
    int    power = static_cast<int>(std::floor(lg));
    float  spc   = power_of_ten(power);
    double start = std::floor(min / static_cast<double>(spc)) * spc;
    double stop  = std::ceil(max / static_cast<double>(spc)) * spc;
    double steps = (stop - start) / spc;
    if (steps <= 1.0)
        return spc / 10.0f;
    if (steps <= 2.0)
        return spc / 4.0f;
    if (steps < 5.0)
        return spc / 2.0f;
    return spc;
}

// Spacing for a single value: its own order of magnitude.
float point_spacing(float value)
{
    if (value == 0.0f)
        return 1.0f;
    return power_of_ten(static_cast<int>(std::floor(std::log10(std::abs(value)))));
}

}   // anonymous namespace

Scale::Scale() = default;

Scale::Scale(float min, float max)
{
    if (!std::isfinite(min) || !std::isfinite(max))
    {
        VELLUM_LOG_WARN("scale", "cannot fit range [{}, {}], using [0, 1]", min, max);
        return;
    }
    if (min > max)
        std::swap(min, max);

    spacing_ = (max - min > 0.0f) ? nice_spacing(min, max) : point_spacing(min);
    if (!(spacing_ > 0.0f) || !std::isfinite(spacing_))
    {
        VELLUM_LOG_WARN("scale", "cannot fit range [{}, {}], using [0, 1]", min, max);
        start_   = 0.0f;
        stop_    = 1.0f;
        spacing_ = 0.1f;
        return;
    }
    start_ = std::floor(min / spacing_) * spacing_;
    stop_  = std::ceil(max / spacing_) * spacing_;

    // Division can round a value just past a multiple; step back out.
    if (start_ > min)
        start_ = (std::floor(min / spacing_) - 1.0f) * spacing_;
    if (stop_ < max)
        stop_ = (std::ceil(max / spacing_) + 1.0f) * spacing_;

    // The next multiple past a bound near FLT_MAX is not representable.
    // Saturate; the outermost interval is then shorter than the spacing.
    if (!std::isfinite(start_) || !std::isfinite(stop_))
    {
        VELLUM_LOG_DEBUG("scale", "range [{}, {}] saturated at float limits", min, max);
        if (!std::isfinite(start_))
            start_ = -FLT_MAX;
        if (!std::isfinite(stop_))
            stop_ = FLT_MAX;
    }
}

Scale Scale::from_data(std::span<const Point> data, float Point::*member)
{
    bool   found   = false;
    float  min     = 0.0f;
    float  max     = 0.0f;
    size_t skipped = 0;
    for (const Point& pt : data)
    {
        float v = pt.*member;
        if (!std::isfinite(v))
        {
            ++skipped;
            continue;
        }
        if (!found)
        {
            min = max = v;
            found     = true;
            continue;
        }
        min = std::min(min, v);
        max = std::max(max, v);
    }
    if (skipped > 0)
        VELLUM_LOG_WARN("scale", "skipped {} non-finite values while fitting scale", skipped);
    if (!found)
        return Scale();
    return Scale(min, max);
}

Scale Scale::union_with(const Scale& other) const
{
    Scale merged(std::min(start_, other.start_), std::max(stop_, other.stop_));
    merged.direction_ = direction_;
    return merged;
}

Scale Scale::inverted() const
{
    Scale s      = *this;
    s.direction_ = is_inverted() ? ScaleDirection::Increasing : ScaleDirection::Decreasing;
    return s;
}

bool Scale::is_degenerate() const
{
    return !(stop_ - start_ > FLT_EPSILON);
}

float Scale::normalize(float value) const
{
    if (is_degenerate())
        return 0.5f;
    const double lo   = start_;
    const double hi   = stop_;
    const double span = hi - lo;
    if (direction_ == ScaleDirection::Increasing)
        return static_cast<float>((value - lo) / span);
    return static_cast<float>((hi - value) / span);
}

size_t Scale::interval_count() const
{
    if (is_degenerate())
        return 0;
    // A saturated bound leaves a partial last interval; count it.
    double ratio = (static_cast<double>(stop_) - static_cast<double>(start_)) / spacing_;
    ratio        = std::ceil(ratio - 1e-3);
    if (!(ratio >= 1.0))
        return 1;
    return static_cast<size_t>(std::min(ratio, kMaxIntervals));
}

std::vector<Tick> Scale::ticks() const
{
    std::vector<Tick> ticks;
    // One notation for the whole axis, chosen from its widest label.
    const double magnitude = std::max(std::abs(static_cast<double>(start_)), std::abs(static_cast<double>(stop_)));
    if (is_degenerate())
    {
        ticks.push_back({0.5f, format_tick_value(start_, spacing_, magnitude)});
        return ticks;
    }

    // Index-based walk so labels never accumulate rounding error; the last
    // tick is pinned to the exact endpoint.
    const size_t n = interval_count();
    ticks.reserve(n + 1);
    for (size_t i = 0; i <= n; ++i)
    {
        double step = static_cast<double>(i) * spacing_;
        float  v;
        if (direction_ == ScaleDirection::Increasing)
            v = (i == n) ? stop_ : static_cast<float>(start_ + step);
        else
            v = (i == n) ? start_ : static_cast<float>(stop_ - step);
        ticks.push_back({normalize(v), format_tick_value(v, spacing_, magnitude)});
    }
    return ticks;
}

}   // namespace vellum
