#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include <vellum/domain.hpp>
#include <vellum/logger.hpp>

namespace vellum
{

Domain::Domain()
{
    orient_y();
}

Domain::Domain(const Scale& x, const Scale& y) : x_(x), y_(y)
{
    orient_y();
}

void Domain::orient_y()
{
    if (y_.direction() == x_.direction())
        y_ = y_.inverted();
}

Domain Domain::from_data(std::span<const Point> data)
{
    return Domain(Scale::from_data(data, &Point::x), Scale::from_data(data, &Point::y));
}

Domain& Domain::including(std::span<const Point> data)
{
    if (data.empty())
        return *this;
    x_ = x_.union_with(Scale::from_data(data, &Point::x));
    y_ = y_.union_with(Scale::from_data(data, &Point::y));
    VELLUM_LOG_DEBUG("domain",
                     "widened to x [{}, {}] y [{}, {}]",
                     x_.start(),
                     x_.stop(),
                     y_.start(),
                     y_.stop());
    return *this;
}

Domain& Domain::set_x(std::span<const Point> data)
{
    Scale fitted = Scale::from_data(data, &Point::x);
    x_           = (fitted.direction() == x_.direction()) ? fitted : fitted.inverted();
    return *this;
}

Domain& Domain::set_y(std::span<const Point> data)
{
    y_ = Scale::from_data(data, &Point::y);
    orient_y();
    return *this;
}

Axis Domain::axis(std::string name, Edge edge) const
{
    const Scale& scale = is_horizontal(edge) ? x_ : y_;
    return Axis(edge, scale.ticks(), std::move(name));
}

namespace
{

// Round half away from zero, saturating at the int32 range; NaN maps to 0.
int32_t to_pixel(float px)
{
    if (std::isnan(px))
        return 0;
    double r = std::round(static_cast<double>(px));
    r        = std::clamp(r,
                   static_cast<double>(std::numeric_limits<int32_t>::min()),
                   static_cast<double>(std::numeric_limits<int32_t>::max()));
    return static_cast<int32_t>(r);
}

}   // anonymous namespace

BoundDomain Domain::bind(const Rect& rect) const
{
    return BoundDomain(*this, rect);
}

BoundDomain::BoundDomain(Domain domain, const Rect& rect) : domain_(std::move(domain)), rect_(rect)
{
}

int32_t BoundDomain::x_map(float x) const
{
    float px = static_cast<float>(rect_.x) + static_cast<float>(rect_.width) * domain_.x_scale().normalize(x);
    return to_pixel(px);
}

int32_t BoundDomain::y_map(float y) const
{
    float py = static_cast<float>(rect_.y) + static_cast<float>(rect_.height) * domain_.y_scale().normalize(y);
    return to_pixel(py);
}

}   // namespace vellum
