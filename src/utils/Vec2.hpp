#pragma once

#include <cmath>  // For std::sqrt
#include <optional>

struct Vec2 {
    double x_ax, y_ax;

    Vec2(double x = 0.0, double y = 0.0) : x_ax(x), y_ax(y) {}

    Vec2 operator-(const Vec2& other) const { return {x_ax - other.x_ax, y_ax - other.y_ax}; }
    Vec2 operator+(const Vec2& other) const { return {x_ax + other.x_ax, y_ax + other.y_ax}; }
    Vec2 operator*(double scalar) const { return {x_ax * scalar, y_ax * scalar}; }
    Vec2 operator/(double scalar) const { return {x_ax / scalar, y_ax / scalar}; }
    Vec2& operator+=(const Vec2& other)
    {
        x_ax += other.x_ax;
        y_ax += other.y_ax;
        return *this;
    }
    Vec2& operator-=(const Vec2& other)
    {
        x_ax -= other.x_ax;
        y_ax -= other.y_ax;
        return *this;
    }
    Vec2& operator*=(double scalar)
    {
        x_ax *= scalar;
        y_ax *= scalar;
        return *this;
    }
    Vec2 operator-() const { return {-x_ax, -y_ax}; }
    bool operator==(const Vec2& other) const { return x_ax == other.x_ax && y_ax == other.y_ax; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }

    [[nodiscard]] double Dot(const Vec2& other) const { return (x_ax * other.x_ax) + (y_ax * other.y_ax); }
    [[nodiscard]] double Cross(const Vec2& other) const { return (x_ax * other.y_ax) - (y_ax * other.x_ax); }
    [[nodiscard]] double LengthSquared() const { return (x_ax * x_ax) + (y_ax * y_ax); }
    [[nodiscard]] double Length() const
    {
        if (LengthSquared() == 0.0) {
            return 0.0;
        }
        return std::sqrt(LengthSquared());
    }
    [[nodiscard]] Vec2 Normalized() const
    {
        double const l = Length();
        if (l == 0) {
            return {0, 0};
        }
        return {x_ax / l, y_ax / l};
    }

    // Perpendicular vector, rotated a quarter turn counter-clockwise.
    [[nodiscard]] Vec2 Normal() const { return {-y_ax, x_ax}; }

    [[nodiscard]] Vec2 Resize(double length) const { return Normalized() * length; }

    // Angle of the vector in radians, as atan2(y, x).
    [[nodiscard]] double AngleOf() const { return std::atan2(y_ax, x_ax); }

    // Rotates with the same convention as Matrix3::Rotation.
    [[nodiscard]] Vec2 Rotated(double radians) const
    {
        double const c = std::cos(radians);
        double const s = std::sin(radians);
        return {(x_ax * c) + (y_ax * s), (-x_ax * s) + (y_ax * c)};
    }

    // Intersection of segments a1-b1 and a2-b2, if they cross.
    static std::optional<Vec2> SegmentIntersect(const Vec2& a1, const Vec2& b1, const Vec2& a2, const Vec2& b2)
    {
        Vec2 const ray_1 = b1 - a1;
        Vec2 const ray_2 = b2 - a2;
        Vec2 const delta = a2 - a1;

        double const d = ray_2.Cross(ray_1);
        double const t1 = ray_2.Cross(delta);
        double const t2 = ray_1.Cross(delta);

        if (d == 0) {
            return std::nullopt;
        }
        if (d > 0 && (t2 < 0 || t2 > d || t1 < 0 || t1 > d)) {
            return std::nullopt;
        }
        if (d < 0 && (t2 < d || t1 < d || t1 > 0 || t2 > 0)) {
            return std::nullopt;
        }

        return Vec2(a2.x_ax + ((t2 / d) * ray_2.x_ax), a2.y_ax + ((t2 / d) * ray_2.y_ax));
    }
};
