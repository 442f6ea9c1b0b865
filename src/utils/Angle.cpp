#include "utils/Angle.hpp"

#include <cfloat>
#include <cmath>

#include "utils/Constants.hpp"

Angle::Angle(double radians)
{
    SetRadians(radians);
}

Angle Angle::FromDegrees(double degrees)
{
    return Angle(DegToRad(degrees));
}

double Angle::RadToDeg(double radians)
{
    return (radians / constants::kPi) * 180.0;
}

double Angle::DegToRad(double degrees)
{
    return (degrees / 180.0) * constants::kPi;
}

double Angle::Round(double degrees)
{
    // Halves round toward positive infinity.
    return std::floor(((degrees + DBL_EPSILON) * 100.0) + 0.5) / 100.0;
}

void Angle::SetRadians(double radians)
{
    m_radians_ = radians;
    m_degrees_ = Round(RadToDeg(radians));
}

void Angle::SetDegrees(double degrees)
{
    m_degrees_ = degrees;
    m_radians_ = DegToRad(degrees);
}

Angle Angle::operator+(const Angle& other) const
{
    return Angle(m_radians_ + other.m_radians_);
}

Angle Angle::operator-(const Angle& other) const
{
    return Angle(m_radians_ - other.m_radians_);
}

Angle Angle::Normalize() const
{
    double deg = Round(m_degrees_);
    while (deg < 0) {
        deg += 360;
    }
    while (deg >= 360) {
        deg -= 360;
    }
    return FromDegrees(deg);
}

Angle Angle::Normalize180() const
{
    double deg = Round(m_degrees_);
    while (deg <= -180) {
        deg += 360;
    }
    while (deg > 180) {
        deg -= 360;
    }
    return FromDegrees(deg);
}

Angle Angle::Normalize720() const
{
    double deg = Round(m_degrees_);
    while (deg < -360) {
        deg += 360;
    }
    while (deg >= 360) {
        deg -= 360;
    }
    return FromDegrees(deg);
}

Angle Angle::Negative() const
{
    return Angle(-m_radians_);
}

bool Angle::IsVertical() const
{
    return m_degrees_ == 90 || m_degrees_ == 270;
}

bool Angle::IsHorizontal() const
{
    return m_degrees_ == 0 || m_degrees_ == 180;
}

Vec2 Angle::RotatePoint(const Vec2& point, const Vec2& origin) const
{
    double x = point.x_ax - origin.x_ax;
    double y = point.y_ax - origin.y_ax;

    Angle const normalized = Normalize();
    double const deg = normalized.Degrees();

    if (deg == 0) {
        // identity
    } else if (deg == 90) {
        double const tmp = x;
        x = y;
        y = -tmp;
    } else if (deg == 180) {
        x = -x;
        y = -y;
    } else if (deg == 270) {
        double const tmp = x;
        x = -y;
        y = tmp;
    } else {
        double const sina = std::sin(normalized.Radians());
        double const cosa = std::cos(normalized.Radians());
        double const x0 = x;
        double const y0 = y;
        x = (y0 * sina) + (x0 * cosa);
        y = (y0 * cosa) - (x0 * sina);
    }

    return {x + origin.x_ax, y + origin.y_ax};
}
