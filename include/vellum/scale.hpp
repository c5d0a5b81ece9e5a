#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <vellum/point.hpp>

namespace vellum
{

/// One labeled mark on an axis.
///
/// `value` is the *normalized* position in [0, 1] along the axis, computed
/// by the owning Scale when the tick is generated.  `text` is the label for
/// the data value at that position.
struct Tick
{
    float       value = 0.0f;
    std::string text;

    bool operator==(const Tick&) const = default;
};

enum class ScaleDirection : uint8_t
{
    Increasing,   // start maps to 0, stop maps to 1
    Decreasing,   // stop maps to 0, start maps to 1 (screen Y)
};

/// Linear numeric scale fitted to "nice" bounds.
///
/// The constructor picks a tick spacing from {p/10, p/4, p/2, p} where
/// p = 10^floor(log10(max - min)), choosing it from the number of whole
/// p-steps the data covers, then widens [min, max] outward to multiples of
/// that spacing.  This yields between 4 and 10 tick intervals for any data
/// magnitude.  Bounds are single precision; near FLT_MAX a bound whose
/// next multiple is not representable saturates to +/-FLT_MAX.
///
/// Scales are small values: every operation returns a new Scale.
class Scale
{
   public:
    /// Scale over [0, 1] with spacing 0.1.
    Scale();

    /// Fit [min, max].  Reversed endpoints are swapped.  Equal endpoints
    /// produce a scale around the value; when the value itself sits on a
    /// spacing multiple the scale is degenerate (start == stop).
    Scale(float min, float max);

    /// Fit the range of one coordinate of `data`, e.g.
    /// `Scale::from_data(points, &Point::x)`.  Non-finite values are
    /// skipped; no usable values yields the default scale.
    static Scale from_data(std::span<const Point> data, float Point::*member);

    /// Scale covering both this and `other`, refitted so the combined
    /// spacing stays nice.  Keeps this scale's direction.
    Scale union_with(const Scale& other) const;

    /// Same range with the direction flipped.
    Scale inverted() const;

    /// Position of `value` in [0, 1] (outside for values past the bounds).
    /// A degenerate scale maps everything to 0.5.
    float normalize(float value) const;

    /// Ticks from start to stop (stop to start when decreasing), both
    /// inclusive.  A degenerate scale yields one centered tick.
    std::vector<Tick> ticks() const;

    float          start() const { return start_; }
    float          stop() const { return stop_; }
    ScaleDirection direction() const { return direction_; }
    bool           is_inverted() const { return direction_ == ScaleDirection::Decreasing; }
    bool           is_degenerate() const;

    /// Signed spacing: negative when the scale is inverted.
    float tick_spacing() const
    {
        return direction_ == ScaleDirection::Increasing ? spacing_ : -spacing_;
    }

    /// Number of tick intervals between start and stop.
    size_t interval_count() const;

    bool operator==(const Scale&) const = default;

   private:
    float          start_     = 0.0f;
    float          stop_      = 1.0f;
    float          spacing_   = 0.1f;   // always > 0
    ScaleDirection direction_ = ScaleDirection::Increasing;
};

}   // namespace vellum
