#pragma once

#include <memory>
#include <optional>
#include <string>

#include <SDL3/SDL.h>

#include "utils/Vec2.hpp"

class Config;
class Events;
class Window;
class Renderer;
class DocumentViewer;
enum class WindowEventType;

class Application
{
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    // 'document' overrides the viewer.document setting when given.
    bool Initialize(const std::optional<std::string>& document = std::nullopt);
    int Run();
    void Shutdown();

    bool IsRunning() const;
    void Quit();

    Config* GetConfig() const;
    Events* GetEvents() const;

private:
    void LoadConfig();
    bool InitializeCoreSubsystems();
    bool InitializeViewer();
    std::unique_ptr<Renderer> CreateRenderer() const;
    void LoadDocument(const std::string& name);

    void ProcessEvents();
    void Render();

    void HandleInput(const SDL_Event& event);
    void HandleKey(SDL_Keycode key);
    void HandleWindowEvent(WindowEventType event_type);
    void ToggleNetHighlight();
    void ResizeToWindow();

    // Window coordinates to canvas pixels.
    [[nodiscard]] Vec2 ToCanvas(float x, float y) const;

    std::unique_ptr<Config> m_config;
    std::unique_ptr<Events> m_events;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<DocumentViewer> m_viewer;

    // Application State
    bool m_isRunning;
    bool m_isMinimized;
    std::string m_appName;
    std::string m_backend;
    std::string m_documentName;
    int m_windowWidth;
    int m_windowHeight;

    // Mouse drag state
    bool m_isPanning;
};
