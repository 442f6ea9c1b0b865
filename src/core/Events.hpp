#pragma once

#include <SDL3/SDL.h>
#include <functional>

enum class WindowEventType {
    kMinimized,
    kRestored,
    kShown,
    kHidden,
    kResized,
};

// Drains the SDL event queue. Quit requests are handled here; window state
// changes and input are forwarded to the registered callbacks.
class Events
{
public:
    using WindowEventCallback = std::function<void(WindowEventType)>;
    using InputCallback = std::function<void(const SDL_Event&)>;

    Events();
    ~Events();

    void ProcessEvents();
    bool ShouldQuit() const;
    void RequestQuit() { m_should_quit_ = true; }

    void SetWindowEventCallback(WindowEventCallback callback);
    // Mouse and keyboard events.
    void SetInputCallback(InputCallback callback);

private:
    void NotifyWindowEvent(WindowEventType event_type);

    bool m_should_quit_;
    WindowEventCallback m_window_event_callback_;
    InputCallback m_input_callback_;
};
