#pragma once

#include <optional>
#include <vector>

#include "utils/Vec2.hpp"

class Element;
class Matrix3;

// Axis-aligned box. The context is a non-owning back-reference to the item the
// box was computed for; it is only used as a lookup key when hit-testing.
class BBox
{
public:
    BBox() = default;
    // Negative width or height is normalized by moving the origin.
    BBox(double x, double y, double w, double h, const Element* context = nullptr);

    static BBox FromCorners(double x1, double y1, double x2, double y2, const Element* context = nullptr);
    static BBox FromPoints(const std::vector<Vec2>& points, const Element* context = nullptr);
    // Union of all valid boxes; an empty box when none are valid.
    static BBox Combine(const std::vector<BBox>& boxes, const Element* context = nullptr);

    [[nodiscard]] bool IsValid() const { return m_w_ != 0 || m_h_ != 0; }

    [[nodiscard]] double X() const { return m_x_; }
    [[nodiscard]] double Y() const { return m_y_; }
    [[nodiscard]] double W() const { return m_w_; }
    [[nodiscard]] double H() const { return m_h_; }
    [[nodiscard]] double X2() const { return m_x_ + m_w_; }
    [[nodiscard]] double Y2() const { return m_y_ + m_h_; }

    [[nodiscard]] Vec2 Start() const { return {m_x_, m_y_}; }
    [[nodiscard]] Vec2 End() const { return {X2(), Y2()}; }
    [[nodiscard]] Vec2 TopLeft() const { return Start(); }
    [[nodiscard]] Vec2 TopRight() const { return {X2(), m_y_}; }
    [[nodiscard]] Vec2 BottomLeft() const { return {m_x_, Y2()}; }
    [[nodiscard]] Vec2 BottomRight() const { return End(); }
    [[nodiscard]] Vec2 Center() const { return {m_x_ + (m_w_ / 2), m_y_ + (m_h_ / 2)}; }

    [[nodiscard]] const Element* GetContext() const { return m_context_; }
    void SetContext(const Element* context) { m_context_ = context; }

    [[nodiscard]] BBox Transform(const Matrix3& mat) const;
    [[nodiscard]] BBox Grow(double d) const { return Grow(d, d); }
    [[nodiscard]] BBox Grow(double dx, double dy) const;
    [[nodiscard]] BBox Scale(double s) const;
    [[nodiscard]] BBox MirrorVertical() const;

    [[nodiscard]] bool Contains(const BBox& other) const;
    // Inclusive of the edges.
    [[nodiscard]] bool ContainsPoint(const Vec2& v) const;
    [[nodiscard]] Vec2 ConstrainPoint(const Vec2& v) const;

    // Point where the segment a-b first meets the box outline, starting from a.
    // Empty when a is inside the box or the segment never reaches it.
    [[nodiscard]] std::optional<Vec2> IntersectSegment(const Vec2& a, const Vec2& b) const;

    bool operator==(const BBox& other) const
    {
        return m_x_ == other.m_x_ && m_y_ == other.m_y_ && m_w_ == other.m_w_ && m_h_ == other.m_h_ && m_context_ == other.m_context_;
    }

private:
    double m_x_ = 0.0;
    double m_y_ = 0.0;
    double m_w_ = 0.0;
    double m_h_ = 0.0;
    const Element* m_context_ = nullptr;
};
