#include "Window.hpp"

#include <iostream>

Window::Window() : m_window_(nullptr), m_sdl_initialized_(false) {}

Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const std::string& title, int width, int height, bool opengl)
{
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        std::cerr << "Error: SDL_Init(): " << SDL_GetError() << std::endl;
        return false;
    }
    m_sdl_initialized_ = true;

    std::cout << "SDL initialized successfully" << std::endl;

    // Shown once the renderer is ready
    SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    if (opengl) {
        window_flags |= SDL_WINDOW_OPENGL;
    }

    m_window_ = SDL_CreateWindow(title.c_str(), width, height, window_flags);
    if (m_window_ == nullptr) {
        std::cerr << "Error: SDL_CreateWindow(): " << SDL_GetError() << std::endl;
        Shutdown();
        return false;
    }

    SDL_SetWindowPosition(m_window_, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);

    std::cout << "Window created successfully" << std::endl;
    return true;
}

void Window::Shutdown()
{
    if (m_window_) {
        SDL_DestroyWindow(m_window_);
        m_window_ = nullptr;
    }

    if (m_sdl_initialized_) {
        SDL_Quit();
        m_sdl_initialized_ = false;
    }
}

void Window::Show()
{
    if (m_window_) {
        SDL_ShowWindow(m_window_);
    }
}

int Window::GetPixelWidth() const
{
    int width = 0;
    SDL_GetWindowSizeInPixels(m_window_, &width, nullptr);
    return width;
}

int Window::GetPixelHeight() const
{
    int height = 0;
    SDL_GetWindowSizeInPixels(m_window_, nullptr, &height);
    return height;
}

float Window::GetPixelDensity() const
{
    float const density = SDL_GetWindowPixelDensity(m_window_);
    return density > 0.0f ? density : 1.0f;
}
