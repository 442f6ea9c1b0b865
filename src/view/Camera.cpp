#include "Camera.hpp"

#include <algorithm>  // For std::min/max

#include "Viewport.hpp"  // Needed for Camera::FocusOnRect

const double kDefaultZoom = 1.0;

Camera::Camera() : m_position_(0, 0), m_zoom_(kDefaultZoom), m_rotation_(0) {}

void Camera::SetZoom(double zoom)
{
    m_zoom_ = std::max(m_min_zoom_, std::min(zoom, m_max_zoom_));
}

void Camera::SetZoomLimits(double min_zoom, double max_zoom)
{
    if (min_zoom <= 0 || max_zoom < min_zoom) {
        return;
    }
    m_min_zoom_ = min_zoom;
    m_max_zoom_ = max_zoom;
    SetZoom(m_zoom_);
}

void Camera::Pan(const Vec2& world_delta)
{
    m_position_ -= world_delta;
}

void Camera::ZoomAt(const Vec2& screen_point, double zoom_factor, const Viewport& viewport)
{
    Vec2 const world_before = viewport.ScreenToWorld(screen_point, *this);
    SetZoom(m_zoom_ * zoom_factor);
    Vec2 const world_after = viewport.ScreenToWorld(screen_point, *this);
    m_position_ += world_before - world_after;
}

void Camera::Reset()
{
    m_position_ = Vec2(0, 0);
    m_zoom_ = kDefaultZoom;
    m_rotation_ = Angle(0);
}

Matrix3 Camera::GetMatrix(const Viewport& viewport) const
{
    // Applied right to left: move the camera position to the origin, roll,
    // zoom, then move the origin to the center of the viewport.
    Vec2 const center = viewport.GetScreenCenter();
    return Matrix3::Translation(center.x_ax, center.y_ax)
        .ScaleSelf(m_zoom_, m_zoom_)
        .RotateSelf(m_rotation_.Radians())
        .TranslateSelf(-m_position_.x_ax, -m_position_.y_ax);
}

BBox Camera::GetVisibleBBox(const Viewport& viewport) const
{
    Matrix3 const inverse = GetMatrix(viewport).Inverse();
    Vec2 const origin(viewport.GetX(), viewport.GetY());
    Vec2 const size(viewport.GetWidth(), viewport.GetHeight());
    return BBox::FromPoints(inverse.TransformAll({origin, origin + Vec2(size.x_ax, 0), origin + size, origin + Vec2(0, size.y_ax)}));
}

void Camera::FocusOnRect(const BBox& world_rect, const Viewport& viewport, double padding)
{
    if (world_rect.W() <= 0 || world_rect.H() <= 0 || viewport.GetWidth() <= 0 || viewport.GetHeight() <= 0) {
        // Cannot focus on an empty rect or with an invalid viewport
        return;
    }

    m_position_ = world_rect.Center();

    // The padding is a fraction of the rect's width/height added to each side.
    double const padded_rect_width = world_rect.W() * (1.0 + padding);
    double const padded_rect_height = world_rect.H() * (1.0 + padding);

    double const zoom_x = static_cast<double>(viewport.GetWidth()) / padded_rect_width;
    double const zoom_y = static_cast<double>(viewport.GetHeight()) / padded_rect_height;

    // Use the smaller of the two zoom factors to ensure the entire rect fits.
    SetZoom(std::min(zoom_x, zoom_y));
    m_rotation_ = Angle(0);
}
