#pragma once

#include "utils/Vec2.hpp"

class Camera;  // Forward declaration

// Pixel rectangle of the canvas the camera projects into.
class Viewport
{
public:
    Viewport();
    Viewport(int screen_x, int screen_y, int screen_width, int screen_height);

    void SetDimensions(int x, int y, int width, int height);
    void SetSize(int width, int height);

    [[nodiscard]] int GetX() const { return m_screen_x_; }
    [[nodiscard]] int GetY() const { return m_screen_y_; }
    [[nodiscard]] int GetWidth() const { return m_screen_width_; }
    [[nodiscard]] int GetHeight() const { return m_screen_height_; }
    [[nodiscard]] bool IsReady() const { return m_screen_width_ > 0 && m_screen_height_ > 0; }
    [[nodiscard]] Vec2 GetScreenCenter() const;  // Center of the viewport in screen coordinates

    // Converts a point from screen coordinates (e.g., mouse position) to world coordinates
    [[nodiscard]] Vec2 ScreenToWorld(const Vec2& screen_point, const Camera& camera) const;

    // Converts a point from world coordinates to screen coordinates
    [[nodiscard]] Vec2 WorldToScreen(const Vec2& world_point, const Camera& camera) const;

    // Deltas ignore the translation part of the transform.
    [[nodiscard]] Vec2 ScreenDeltaToWorldDelta(const Vec2& screen_delta, const Camera& camera) const;
    [[nodiscard]] Vec2 WorldDeltaToScreenDelta(const Vec2& world_delta, const Camera& camera) const;

private:
    int m_screen_x_;       // Top-left X of the viewport on the screen/window
    int m_screen_y_;       // Top-left Y of the viewport on the screen/window
    int m_screen_width_;   // Width of the viewport in pixels
    int m_screen_height_;  // Height of the viewport in pixels
};
