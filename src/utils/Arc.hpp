#pragma once

#include <vector>

#include "utils/Angle.hpp"
#include "utils/BBox.hpp"
#include "utils/Vec2.hpp"

// A circular arc running counter-clockwise from start_angle to end_angle.
class Arc
{
public:
    Arc() = default;
    Arc(const Vec2& center, double radius, const Angle& start_angle, const Angle& end_angle, double width);

    // Reconstructs the arc through three points on its circumference, in
    // either winding. The result runs counter-clockwise with start in [0, 360)
    // and end possibly past 360. Identical start and end give a full circle.
    static Arc FromThreePoints(const Vec2& start, const Vec2& mid, const Vec2& end, double width = 1.0);

    [[nodiscard]] const Vec2& GetCenter() const { return m_center_; }
    [[nodiscard]] double GetRadius() const { return m_radius_; }
    [[nodiscard]] const Angle& GetStartAngle() const { return m_start_angle_; }
    [[nodiscard]] const Angle& GetEndAngle() const { return m_end_angle_; }
    [[nodiscard]] double GetWidth() const { return m_width_; }

    [[nodiscard]] Angle GetArcAngle() const { return m_end_angle_ - m_start_angle_; }
    [[nodiscard]] Vec2 GetStartPoint() const;
    [[nodiscard]] Vec2 GetEndPoint() const;

    // Samples the arc every pi/32 radians, always ending exactly on the end
    // angle. Throws std::invalid_argument if the start angle is past the end.
    [[nodiscard]] std::vector<Vec2> ToPolyline() const;
    // Polyline closed through the center.
    [[nodiscard]] std::vector<Vec2> ToPolygon() const;

    [[nodiscard]] BBox GetBoundingBox() const;

private:
    Vec2 m_center_;
    double m_radius_ = 0.0;
    Angle m_start_angle_;
    Angle m_end_angle_;
    double m_width_ = 0.0;
};

namespace geometry_utils
{
// Circle center from three points, ported from KiCad's trigo CalcArcCenter.
// Inputs are expected in integer-like units (nanometers) so the center can be
// snapped to round values within the propagated rounding uncertainty.
Vec2 ArcCenterFromThreePoints(const Vec2& start, const Vec2& mid, const Vec2& end);
}  // namespace geometry_utils
