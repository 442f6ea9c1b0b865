#include "utils/Arc.hpp"

#include <cfloat>
#include <cmath>
#include <stdexcept>
#include <string>

#include "utils/Constants.hpp"

Arc::Arc(const Vec2& center, double radius, const Angle& start_angle, const Angle& end_angle, double width)
    : m_center_(center), m_radius_(radius), m_start_angle_(start_angle), m_end_angle_(end_angle), m_width_(width)
{
}

Arc Arc::FromThreePoints(const Vec2& start, const Vec2& mid, const Vec2& end, double width)
{
    // Work in whole nanometers, KiCad's internal units, so axis-aligned chords
    // are exact and the center snapping sees the values it expects.
    constexpr double kUnits = 1000000.0;
    auto to_units = [](const Vec2& p) { return Vec2(std::round(p.x_ax * kUnits), std::round(p.y_ax * kUnits)); };
    Vec2 center = geometry_utils::ArcCenterFromThreePoints(to_units(start), to_units(mid), to_units(end));
    center = center / kUnits;

    double const radius = (center - mid).Length();

    Angle start_angle = Angle((start - center).AngleOf()).Normalize();
    Angle end_angle = Angle((end - center).AngleOf()).Normalize();

    // The winding of start -> mid -> end picks the direction of travel.
    double sweep = 360.0;
    if (start != end) {
        double const turn = (mid - start).Cross(end - mid);
        if (turn >= 0) {
            sweep = Angle::FromDegrees(end_angle.Degrees() - start_angle.Degrees()).Normalize().Degrees();
        } else {
            sweep = -Angle::FromDegrees(start_angle.Degrees() - end_angle.Degrees()).Normalize().Degrees();
        }
    }

    // Clockwise arcs are stored counter-clockwise from their end point.
    if (sweep < 0) {
        start_angle = end_angle;
        sweep = -sweep;
    }
    end_angle.SetDegrees(start_angle.Degrees() + sweep);

    return Arc(center, radius, start_angle, end_angle, width);
}

Vec2 Arc::GetStartPoint() const
{
    double const theta = m_start_angle_.Radians();
    return {m_center_.x_ax + (std::cos(theta) * m_radius_), m_center_.y_ax + (std::sin(theta) * m_radius_)};
}

Vec2 Arc::GetEndPoint() const
{
    double const theta = m_end_angle_.Radians();
    return {m_center_.x_ax + (std::cos(theta) * m_radius_), m_center_.y_ax + (std::sin(theta) * m_radius_)};
}

std::vector<Vec2> Arc::ToPolyline() const
{
    double const start = m_start_angle_.Radians();
    double const end = m_end_angle_.Radians();

    if (start > end) {
        throw std::invalid_argument("Arc::ToPolyline: invalid arc, starts at " + std::to_string(start) + " and ends at " + std::to_string(end));
    }

    std::vector<Vec2> points;
    for (double theta = start; theta < end; theta += constants::kArcStepRadians) {
        points.emplace_back(m_center_.x_ax + (std::cos(theta) * m_radius_), m_center_.y_ax + (std::sin(theta) * m_radius_));
    }

    Vec2 const last_point = GetEndPoint();
    if (points.empty() || points.back() != last_point) {
        points.push_back(last_point);
    }

    return points;
}

std::vector<Vec2> Arc::ToPolygon() const
{
    std::vector<Vec2> points = ToPolyline();
    points.push_back(m_center_);
    return points;
}

BBox Arc::GetBoundingBox() const
{
    return BBox::FromPoints(ToPolyline());
}

namespace geometry_utils
{

Vec2 ArcCenterFromThreePoints(const Vec2& start, const Vec2& mid, const Vec2& end)
{
    constexpr double kSqrt1_2 = 0.70710678118654752440;

    double const y_delta_21 = mid.y_ax - start.y_ax;
    double x_delta_21 = mid.x_ax - start.x_ax;
    double const y_delta_32 = end.y_ax - mid.y_ax;
    double x_delta_32 = end.x_ax - mid.x_ax;

    // Mid is the half-way point with one chord horizontal and the other
    // vertical, so the center lies between start and end.
    if ((x_delta_21 == 0.0 && y_delta_32 == 0.0) || (y_delta_21 == 0.0 && x_delta_32 == 0.0)) {
        return {(start.x_ax + end.x_ax) / 2.0, (start.y_ax + end.y_ax) / 2.0};
    }

    if (x_delta_21 == 0.0) {
        x_delta_21 = DBL_EPSILON;
    }
    if (x_delta_32 == 0.0) {
        x_delta_32 = -DBL_EPSILON;
    }

    double slope_a = y_delta_21 / x_delta_21;
    double slope_b = y_delta_32 / x_delta_32;

    double const d_slope_a = slope_a * Vec2(0.5 / y_delta_21, 0.5 / x_delta_21).Length();
    double const d_slope_b = slope_b * Vec2(0.5 / y_delta_32, 0.5 / x_delta_32).Length();

    if (slope_a == slope_b) {
        if (start == end) {
            // Full circle: the center is half-way between mid and either end.
            return {(start.x_ax + mid.x_ax) / 2.0, (start.y_ax + mid.y_ax) / 2.0};
        }
        // Colinear points put the center at infinity. Nudge the slopes apart,
        // accepting a small error in the center.
        slope_a += DBL_EPSILON;
        slope_b -= DBL_EPSILON;
    }

    if (slope_a == 0.0) {
        slope_a = DBL_EPSILON;
    }

    // The d_ variables carry the propagated uncertainty of each term from
    // rounding the inputs to the nearest unit. Covariance is ignored and the
    // series is truncated after the first term.
    double const slope_ab_start_end_y = slope_a * slope_b * (start.y_ax - end.y_ax);
    double const d_slope_ab_start_end_y =
        slope_ab_start_end_y *
        std::sqrt((((d_slope_a / slope_a) * d_slope_a) / slope_a) + (((d_slope_b / slope_b) * d_slope_b) / slope_b) +
                  ((kSqrt1_2 / (start.y_ax - end.y_ax)) * (kSqrt1_2 / (start.y_ax - end.y_ax))));

    double const slope_b_start_mid_x = slope_b * (start.x_ax + mid.x_ax);
    double const d_slope_b_start_mid_x =
        slope_b_start_mid_x *
        std::sqrt((((d_slope_b / slope_b) * d_slope_b) / slope_b) + (((kSqrt1_2 / (start.x_ax + mid.x_ax)) * kSqrt1_2) / (start.x_ax + mid.x_ax)));

    double const slope_a_mid_end_x = slope_a * (mid.x_ax + end.x_ax);
    double const d_slope_a_mid_end_x =
        slope_a_mid_end_x *
        std::sqrt((((d_slope_a / slope_a) * d_slope_a) / slope_a) + (((kSqrt1_2 / (mid.x_ax + end.x_ax)) * kSqrt1_2) / (mid.x_ax + end.x_ax)));

    double const twice_b_a_slope_diff = 2 * (slope_b - slope_a);
    double const d_twice_b_a_slope_diff = 2 * std::sqrt((d_slope_b * d_slope_b) + (d_slope_a * d_slope_a));

    double const center_numerator_x = slope_ab_start_end_y + slope_b_start_mid_x - slope_a_mid_end_x;
    double const d_center_numerator_x =
        std::sqrt((d_slope_ab_start_end_y * d_slope_ab_start_end_y) + (d_slope_b_start_mid_x * d_slope_b_start_mid_x) + (d_slope_a_mid_end_x * d_slope_a_mid_end_x));

    double const center_x = center_numerator_x / twice_b_a_slope_diff;
    double const d_center_x =
        center_x * std::sqrt((((d_center_numerator_x / center_numerator_x) * d_center_numerator_x) / center_numerator_x) +
                             (((d_twice_b_a_slope_diff / twice_b_a_slope_diff) * d_twice_b_a_slope_diff) / twice_b_a_slope_diff));

    double const center_numerator_y = ((start.x_ax + mid.x_ax) / 2.0) - center_x;
    double const d_center_numerator_y = std::sqrt((1.0 / 8.0) + (d_center_x * d_center_x));

    double const center_first_term = center_numerator_y / slope_a;
    double const d_center_first_term_y =
        center_first_term * std::sqrt((((d_center_numerator_y / center_numerator_y) * d_center_numerator_y) / center_numerator_y) +
                                      (((d_slope_a / slope_a) * d_slope_a) / slope_a));

    double const center_y = center_first_term + ((start.y_ax + mid.y_ax) / 2.0);
    double const d_center_y = std::sqrt((d_center_first_term_y * d_center_first_term_y) + (1.0 / 8.0));

    double const rounded_100_center_x = std::floor((center_x + 50.0) / 100.0) * 100.0;
    double const rounded_100_center_y = std::floor((center_y + 50.0) / 100.0) * 100.0;
    double const rounded_10_center_x = std::floor((center_x + 5.0) / 10.0) * 10.0;
    double const rounded_10_center_y = std::floor((center_y + 5.0) / 10.0) * 10.0;

    // Any value inside the uncertainty range is equally valid, so prefer a
    // round one. This keeps centers on 100nm or 10nm multiples.
    if (std::abs(rounded_100_center_x - center_x) < d_center_x && std::abs(rounded_100_center_y - center_y) < d_center_y) {
        return {rounded_100_center_x, rounded_100_center_y};
    }
    if (std::abs(rounded_10_center_x - center_x) < d_center_x && std::abs(rounded_10_center_y - center_y) < d_center_y) {
        return {rounded_10_center_x, rounded_10_center_y};
    }
    return {center_x, center_y};
}

}  // namespace geometry_utils
