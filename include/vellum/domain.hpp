#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vellum/axis.hpp>
#include <vellum/point.hpp>
#include <vellum/rect.hpp>
#include <vellum/scale.hpp>

namespace vellum
{

class BoundDomain;

/// Data-space extent of a chart: one Scale per dimension.
///
/// The Y scale is always kept inverted relative to X, so that larger Y
/// values map to smaller screen rows.  Callers pass scales in their natural
/// direction and never deal with the flip themselves.
class Domain
{
   public:
    Domain();
    Domain(const Scale& x, const Scale& y);

    /// Fit both scales to `data`.
    static Domain from_data(std::span<const Point> data);

    /// Widen both scales to also cover `data`.
    Domain& including(std::span<const Point> data);

    /// Refit only the X (resp. Y) scale to `data`.
    Domain& set_x(std::span<const Point> data);
    Domain& set_y(std::span<const Point> data);

    const Scale& x_scale() const { return x_; }
    const Scale& y_scale() const { return y_; }

    /// Axis for `edge`, ticked from X on Top/Bottom and from Y on Left/Right.
    Axis axis(std::string name, Edge edge) const;

    /// Map this domain onto a pixel rectangle.
    BoundDomain bind(const Rect& rect) const;

    bool operator==(const Domain&) const = default;

   private:
    void orient_y();

    Scale x_;
    Scale y_;
};

/// A Domain paired with the pixel rectangle it maps onto.
class BoundDomain
{
   public:
    BoundDomain() = default;
    BoundDomain(Domain domain, const Rect& rect);

    int32_t x_map(float x) const;
    int32_t y_map(float y) const;

    const Domain& domain() const { return domain_; }
    const Rect&   rect() const { return rect_; }

   private:
    Domain domain_;
    Rect   rect_;
};

}   // namespace vellum
