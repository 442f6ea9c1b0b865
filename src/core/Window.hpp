#pragma once

#include <string>

#include <SDL3/SDL.h>

// The application's SDL window. Rendering contexts are created by the
// backends, so the window only needs to know whether OpenGL will be used.
class Window
{
public:
    Window();
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    bool Initialize(const std::string& title, int width, int height, bool opengl);
    void Shutdown();
    void Show();

    [[nodiscard]] SDL_Window* GetWindow() const { return m_window_; }

    // Drawable size in pixels; differs from the window size on high density displays.
    [[nodiscard]] int GetPixelWidth() const;
    [[nodiscard]] int GetPixelHeight() const;
    // Pixels per window coordinate unit.
    [[nodiscard]] float GetPixelDensity() const;

private:
    SDL_Window* m_window_;
    bool m_sdl_initialized_;
};
