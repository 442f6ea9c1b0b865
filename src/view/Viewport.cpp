#include "view/Viewport.hpp"

#include "utils/Matrix3.hpp"
#include "view/Camera.hpp"

Viewport::Viewport() : m_screen_x_(0), m_screen_y_(0), m_screen_width_(0), m_screen_height_(0) {}

Viewport::Viewport(int screen_x, int screen_y, int screen_width, int screen_height)
    : m_screen_x_(screen_x), m_screen_y_(screen_y), m_screen_width_(screen_width), m_screen_height_(screen_height)
{
}

void Viewport::SetDimensions(int x, int y, int width, int height)
{
    m_screen_x_ = x;
    m_screen_y_ = y;
    m_screen_width_ = width;
    m_screen_height_ = height;
}

void Viewport::SetSize(int width, int height)
{
    m_screen_width_ = width;
    m_screen_height_ = height;
}

Vec2 Viewport::GetScreenCenter() const
{
    return Vec2(m_screen_x_ + (m_screen_width_ / 2.0), m_screen_y_ + (m_screen_height_ / 2.0));
}

Vec2 Viewport::ScreenToWorld(const Vec2& screen_point, const Camera& camera) const
{
    if (!IsReady() || camera.GetZoom() == 0.0) {
        return camera.GetPosition();
    }
    return camera.GetMatrix(*this).Inverse().Transform(screen_point);
}

Vec2 Viewport::WorldToScreen(const Vec2& world_point, const Camera& camera) const
{
    return camera.GetMatrix(*this).Transform(world_point);
}

Vec2 Viewport::ScreenDeltaToWorldDelta(const Vec2& screen_delta, const Camera& camera) const
{
    if (camera.GetZoom() == 0.0) {
        return Vec2(0, 0);
    }
    // Undo zoom then roll.
    return (screen_delta / camera.GetZoom()).Rotated(-camera.GetRotation().Radians());
}

Vec2 Viewport::WorldDeltaToScreenDelta(const Vec2& world_delta, const Camera& camera) const
{
    return world_delta.Rotated(camera.GetRotation().Radians()) * camera.GetZoom();
}
