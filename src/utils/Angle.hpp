#pragma once

#include "utils/Vec2.hpp"

// An angle kept in both radians and degrees. Degrees are rounded to two
// decimal places so that comparisons match KiCad's integer-centidegree math.
class Angle
{
public:
    Angle() = default;
    explicit Angle(double radians);

    static Angle FromDegrees(double degrees);

    static double RadToDeg(double radians);
    static double DegToRad(double degrees);

    // Rounds degrees to two decimal places.
    static double Round(double degrees);

    [[nodiscard]] double Radians() const { return m_radians_; }
    [[nodiscard]] double Degrees() const { return m_degrees_; }

    void SetRadians(double radians);
    void SetDegrees(double degrees);

    Angle operator+(const Angle& other) const;
    Angle operator-(const Angle& other) const;

    // [0, 360)
    [[nodiscard]] Angle Normalize() const;
    // (-180, 180]
    [[nodiscard]] Angle Normalize180() const;
    // [-360, 360)
    [[nodiscard]] Angle Normalize720() const;

    [[nodiscard]] Angle Negative() const;

    [[nodiscard]] bool IsVertical() const;
    [[nodiscard]] bool IsHorizontal() const;

    [[nodiscard]] Vec2 RotatePoint(const Vec2& point, const Vec2& origin = Vec2(0, 0)) const;

private:
    double m_radians_ = 0.0;
    double m_degrees_ = 0.0;
};
