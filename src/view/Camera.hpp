#pragma once

#include "utils/Angle.hpp"
#include "utils/BBox.hpp"
#include "utils/Matrix3.hpp"
#include "utils/Vec2.hpp"

class Viewport;  // Forward declaration

// 2D camera: the world point at the center of the view, a zoom factor and a
// roll. GetMatrix() maps world coordinates to viewport pixels.
class Camera
{
public:
    static constexpr double kDefaultMinZoom = 0.5;
    static constexpr double kDefaultMaxZoom = 190.0;

    Camera();

    void SetPosition(const Vec2& position) { m_position_ = position; }
    [[nodiscard]] const Vec2& GetPosition() const { return m_position_; }

    // Clamped to the zoom limits.
    void SetZoom(double zoom);
    [[nodiscard]] double GetZoom() const { return m_zoom_; }

    void SetZoomLimits(double min_zoom, double max_zoom);
    [[nodiscard]] double GetMinZoom() const { return m_min_zoom_; }
    [[nodiscard]] double GetMaxZoom() const { return m_max_zoom_; }

    void SetRotation(const Angle& rotation) { m_rotation_ = rotation; }
    [[nodiscard]] const Angle& GetRotation() const { return m_rotation_; }

    // Movement and Zooming
    void Pan(const Vec2& world_delta);
    // Keeps the world point under 'screen_point' fixed.
    void ZoomAt(const Vec2& screen_point, double zoom_factor, const Viewport& viewport);

    void Reset();

    [[nodiscard]] Matrix3 GetMatrix(const Viewport& viewport) const;
    // World-space box covered by the viewport.
    [[nodiscard]] BBox GetVisibleBBox(const Viewport& viewport) const;

    // Centers on the rectangle and zooms so that it fits the viewport.
    void FocusOnRect(const BBox& world_rect, const Viewport& viewport, double padding = 0.0);

private:
    Vec2 m_position_;  // Camera position in world space (center of the view)
    double m_zoom_;
    Angle m_rotation_;
    double m_min_zoom_ = kDefaultMinZoom;
    double m_max_zoom_ = kDefaultMaxZoom;
};
