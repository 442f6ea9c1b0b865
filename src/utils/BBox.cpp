#include "utils/BBox.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

#include "utils/Matrix3.hpp"

BBox::BBox(double x, double y, double w, double h, const Element* context) : m_x_(x), m_y_(y), m_w_(w), m_h_(h), m_context_(context)
{
    if (m_w_ < 0) {
        m_w_ *= -1;
        m_x_ -= m_w_;
    }
    if (m_h_ < 0) {
        m_h_ *= -1;
        m_y_ -= m_h_;
    }
}

BBox BBox::FromCorners(double x1, double y1, double x2, double y2, const Element* context)
{
    if (x2 < x1) {
        std::swap(x1, x2);
    }
    if (y2 < y1) {
        std::swap(y1, y2);
    }
    return BBox(x1, y1, x2 - x1, y2 - y1, context);
}

BBox BBox::FromPoints(const std::vector<Vec2>& points, const Element* context)
{
    if (points.empty()) {
        return BBox(0, 0, 0, 0, context);
    }

    Vec2 start = points.front();
    Vec2 end = points.front();
    for (const Vec2& p : points) {
        start.x_ax = std::min(start.x_ax, p.x_ax);
        start.y_ax = std::min(start.y_ax, p.y_ax);
        end.x_ax = std::max(end.x_ax, p.x_ax);
        end.y_ax = std::max(end.y_ax, p.y_ax);
    }

    return FromCorners(start.x_ax, start.y_ax, end.x_ax, end.y_ax, context);
}

BBox BBox::Combine(const std::vector<BBox>& boxes, const Element* context)
{
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
    bool any_valid = false;

    for (const BBox& box : boxes) {
        if (!box.IsValid()) {
            continue;
        }
        any_valid = true;
        min_x = std::min(min_x, box.X());
        min_y = std::min(min_y, box.Y());
        max_x = std::max(max_x, box.X2());
        max_y = std::max(max_y, box.Y2());
    }

    if (!any_valid) {
        return BBox(0, 0, 0, 0, context);
    }

    return FromCorners(min_x, min_y, max_x, max_y, context);
}

BBox BBox::Transform(const Matrix3& mat) const
{
    Vec2 const start = mat.Transform(Start());
    Vec2 const end = mat.Transform(End());
    return FromCorners(start.x_ax, start.y_ax, end.x_ax, end.y_ax, m_context_);
}

BBox BBox::Grow(double dx, double dy) const
{
    return BBox(m_x_ - dx, m_y_ - dy, m_w_ + (dx * 2), m_h_ + (dy * 2), m_context_);
}

BBox BBox::Scale(double s) const
{
    return FromPoints({Start() * s, End() * s}, m_context_);
}

BBox BBox::MirrorVertical() const
{
    return BBox(m_x_, -m_y_, m_w_, -m_h_);
}

bool BBox::Contains(const BBox& other) const
{
    return ContainsPoint(other.Start()) && ContainsPoint(other.End());
}

bool BBox::ContainsPoint(const Vec2& v) const
{
    return v.x_ax >= m_x_ && v.x_ax <= X2() && v.y_ax >= m_y_ && v.y_ax <= Y2();
}

Vec2 BBox::ConstrainPoint(const Vec2& v) const
{
    return {std::min(std::max(v.x_ax, m_x_), X2()), std::min(std::max(v.y_ax, m_y_), Y2())};
}

std::optional<Vec2> BBox::IntersectSegment(const Vec2& a, const Vec2& b) const
{
    if (ContainsPoint(a)) {
        return std::nullopt;
    }

    const std::array<std::pair<Vec2, Vec2>, 4> edges = {{
        {TopLeft(), BottomLeft()},
        {TopRight(), BottomRight()},
        {TopLeft(), TopRight()},
        {BottomLeft(), BottomRight()},
    }};

    std::optional<Vec2> nearest;
    for (const auto& edge : edges) {
        std::optional<Vec2> const hit = Vec2::SegmentIntersect(a, b, edge.first, edge.second);
        if (!hit) {
            continue;
        }
        if (!nearest || (*hit - a).LengthSquared() < (*nearest - a).LengthSquared()) {
            nearest = hit;
        }
    }

    return nearest;
}
