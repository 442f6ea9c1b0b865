#include "Events.hpp"

#include <utility>

Events::Events() : m_should_quit_(false) {}

Events::~Events() {}

void Events::ProcessEvents()
{
    SDL_Event event;

    // Process all queued events at once
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                m_should_quit_ = true;
                break;
            case SDL_EVENT_WINDOW_MINIMIZED:
                NotifyWindowEvent(WindowEventType::kMinimized);
                break;
            case SDL_EVENT_WINDOW_RESTORED:
                NotifyWindowEvent(WindowEventType::kRestored);
                break;
            case SDL_EVENT_WINDOW_SHOWN:
                NotifyWindowEvent(WindowEventType::kShown);
                break;
            case SDL_EVENT_WINDOW_HIDDEN:
                NotifyWindowEvent(WindowEventType::kHidden);
                break;
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                NotifyWindowEvent(WindowEventType::kResized);
                break;
            case SDL_EVENT_MOUSE_MOTION:
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP:
            case SDL_EVENT_MOUSE_WHEEL:
            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP:
                if (m_input_callback_) {
                    m_input_callback_(event);
                }
                break;
            default:
                break;
        }
    }
}

bool Events::ShouldQuit() const
{
    return m_should_quit_;
}

void Events::SetWindowEventCallback(WindowEventCallback callback)
{
    m_window_event_callback_ = std::move(callback);
}

void Events::SetInputCallback(InputCallback callback)
{
    m_input_callback_ = std::move(callback);
}

void Events::NotifyWindowEvent(WindowEventType event_type)
{
    if (m_window_event_callback_) {
        m_window_event_callback_(event_type);
    }
}
