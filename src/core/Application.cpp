#include "Application.hpp"

#include <filesystem>
#include <future>
#include <iostream>

#include <SDL3/SDL_filesystem.h>

#include "Config.hpp"
#include "Events.hpp"
#include "Window.hpp"
#include "pcb/BoardViewer.hpp"
#include "pcb/SampleBoard.hpp"
#include "render/Blend2DRenderer.hpp"
#include "render/gl/GLRenderer.hpp"
#include "sch/SampleSchematic.hpp"
#include "sch/SchematicViewer.hpp"

namespace
{
constexpr double kWheelZoomStep = 1.1;

std::string GetAppConfigFilePath()
{
    const char* CONFIG_FILENAME = "KiViewer_settings.ini";
    char* prefPath_c = SDL_GetPrefPath("kiviewer", "KiViewer");
    if (!prefPath_c) {
        std::cerr << "Warning: SDL_GetPrefPath failed. Using current directory for config." << std::endl;
        return std::filesystem::current_path().append(CONFIG_FILENAME).string();
    }
    std::filesystem::path pathObj(prefPath_c);
    SDL_free(prefPath_c);

    if (!std::filesystem::exists(pathObj)) {
        try {
            if (!std::filesystem::create_directories(pathObj) && !std::filesystem::exists(pathObj)) {
                std::cerr << "Error: Could not create preference directory: " << pathObj.string() << ". Falling back to current directory." << std::endl;
                return std::filesystem::current_path().append(CONFIG_FILENAME).string();
            }
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Error creating directory " << pathObj.string() << ": " << e.what() << ". Falling back to current directory." << std::endl;
            return std::filesystem::current_path().append(CONFIG_FILENAME).string();
        }
    }
    pathObj /= CONFIG_FILENAME;
    return pathObj.string();
}
}  // namespace

Application::Application()
    : m_isRunning(false), m_isMinimized(false), m_appName("KiCad Layer Viewer"), m_backend("opengl"), m_documentName("board"), m_windowWidth(1280), m_windowHeight(720), m_isPanning(false)
{
}

Application::~Application()
{
    Shutdown();
}

void Application::LoadConfig()
{
    m_config = std::make_unique<Config>();
    std::string configFilePath = GetAppConfigFilePath();
    if (m_config->LoadFromFile(configFilePath)) {
        std::cout << "Successfully loaded config from " << configFilePath << std::endl;
    } else {
        std::cout << "Config file " << configFilePath << " not found or failed to load. Using defaults." << std::endl;
    }

    m_appName = m_config->GetString("application.name", m_appName);
    m_windowWidth = m_config->GetInt("window.width", m_windowWidth);
    m_windowHeight = m_config->GetInt("window.height", m_windowHeight);
    m_backend = m_config->GetString("renderer.backend", m_backend);
    m_documentName = m_config->GetString("viewer.document", m_documentName);
}

bool Application::InitializeCoreSubsystems()
{
    m_events = std::make_unique<Events>();

    m_window = std::make_unique<Window>();
    if (!m_window->Initialize(m_appName, m_windowWidth, m_windowHeight, m_backend == "opengl")) {
        std::cerr << "Failed to initialize window" << std::endl;
        return false;
    }

    m_events->SetWindowEventCallback([this](WindowEventType event_type) {
        HandleWindowEvent(event_type);
    });
    m_events->SetInputCallback([this](const SDL_Event& event) {
        HandleInput(event);
    });

    return true;
}

std::unique_ptr<Renderer> Application::CreateRenderer() const
{
    if (m_backend == "blend2d") {
        return std::make_unique<Blend2DRenderer>(m_window->GetWindow());
    }
    if (m_backend != "opengl") {
        std::cerr << "Application: Unknown renderer backend '" << m_backend << "', using opengl" << std::endl;
    }
    return std::make_unique<GLRenderer>(m_window->GetWindow());
}

bool Application::InitializeViewer()
{
    ViewerSettings const settings = ViewerSettings::FromConfig(*m_config);

    if (m_documentName == "schematic") {
        Theme theme = Theme::DefaultSchematic();
        theme.LoadOverrides(*m_config);
        m_viewer = std::make_unique<SchematicViewer>(CreateRenderer(), std::move(theme), settings);
    } else {
        if (m_documentName != "board") {
            std::cerr << "Application: Unknown document '" << m_documentName << "', showing the board" << std::endl;
            m_documentName = "board";
        }
        Theme theme = Theme::DefaultBoard();
        theme.LoadOverrides(*m_config);
        m_viewer = std::make_unique<BoardViewer>(CreateRenderer(), std::move(theme), settings);
    }

    m_viewer->GetRenderer().SetBackgroundColor(m_viewer->GetTheme().ColorFor("background"));

    if (!m_viewer->Setup()) {
        std::cerr << "Failed to set up the " << m_backend << " renderer" << std::endl;
        return false;
    }

    m_viewer->SetSelectCallback([](const Element* item, const Element* /*previous*/) {
        if (item != nullptr) {
            std::cout << "Selected " << item->GetInfo() << std::endl;
        }
    });

    m_window->Show();
    ResizeToWindow();
    LoadDocument(m_documentName);
    return true;
}

void Application::LoadDocument(const std::string& name)
{
    std::cout << "Application: Loading sample " << name << std::endl;
    if (name == "schematic") {
        m_viewer->LoadAsync(std::async(std::launch::async, []() -> DocumentViewer::DocumentPtr { return CreateSampleSchematic(); }));
    } else {
        m_viewer->LoadAsync(std::async(std::launch::async, []() -> DocumentViewer::DocumentPtr { return CreateSampleBoard(); }));
    }
}

bool Application::Initialize(const std::optional<std::string>& document)
{
    std::cout << "Initializing " << m_appName << "..." << std::endl;

    LoadConfig();
    if (document) {
        m_documentName = *document;
    }

    if (!InitializeCoreSubsystems()) {
        std::cerr << "Failed to initialize core subsystems" << std::endl;
        return false;
    }

    if (!InitializeViewer()) {
        std::cerr << "Failed to initialize viewer" << std::endl;
        return false;
    }

    m_isRunning = true;
    return true;
}

int Application::Run()
{
    std::cout << "Running application..." << std::endl;

    while (IsRunning()) {
        ProcessEvents();
        Render();

        // Nothing is presented while minimized, so there is no vsync to wait on.
        if (m_isMinimized) {
            SDL_Delay(16);
        }
    }

    Shutdown();
    return 0;
}

void Application::Shutdown()
{
    if (!m_config && !m_viewer && !m_window) {
        return;
    }
    std::cout << "Shutting down..." << std::endl;

    if (m_config) {
        std::string configFilePath = GetAppConfigFilePath();
        if (!m_config->SaveToFile(configFilePath)) {
            std::cerr << "Error: Failed to save config file to " << configFilePath << std::endl;
        }
    }

    // The viewer's renderer holds contexts that belong to the window.
    m_viewer.reset();
    m_window.reset();
    m_events.reset();
    m_config.reset();
    m_isRunning = false;
}

bool Application::IsRunning() const
{
    return m_isRunning && !(m_events && m_events->ShouldQuit());
}

void Application::Quit()
{
    m_isRunning = false;
}

Config* Application::GetConfig() const
{
    return m_config.get();
}

Events* Application::GetEvents() const
{
    return m_events.get();
}

void Application::ProcessEvents()
{
    m_events->ProcessEvents();
    m_viewer->PollPendingLoads();
}

void Application::Render()
{
    if (m_isMinimized) {
        return;
    }
    m_viewer->FlushPendingDraw();
}

Vec2 Application::ToCanvas(float x, float y) const
{
    float const density = m_window->GetPixelDensity();
    return {static_cast<double>(x * density), static_cast<double>(y * density)};
}

void Application::HandleInput(const SDL_Event& event)
{
    switch (event.type) {
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            if (event.button.button == SDL_BUTTON_LEFT) {
                m_viewer->Pick(ToCanvas(event.button.x, event.button.y));
            } else if (event.button.button == SDL_BUTTON_RIGHT || event.button.button == SDL_BUTTON_MIDDLE) {
                m_isPanning = true;
            }
            break;
        case SDL_EVENT_MOUSE_BUTTON_UP:
            if (event.button.button == SDL_BUTTON_RIGHT || event.button.button == SDL_BUTTON_MIDDLE) {
                m_isPanning = false;
            }
            break;
        case SDL_EVENT_MOUSE_MOTION:
            m_viewer->SetMousePosition(ToCanvas(event.motion.x, event.motion.y));
            if (m_isPanning) {
                m_viewer->PanBy(ToCanvas(event.motion.xrel, event.motion.yrel));
            }
            break;
        case SDL_EVENT_MOUSE_WHEEL: {
            if (event.wheel.y == 0.0f) {
                break;
            }
            double const factor = event.wheel.y > 0 ? kWheelZoomStep : 1.0 / kWheelZoomStep;
            m_viewer->ZoomAt(ToCanvas(event.wheel.mouse_x, event.wheel.mouse_y), factor);
            break;
        }
        case SDL_EVENT_KEY_DOWN:
            if (!event.key.repeat) {
                HandleKey(event.key.key);
            }
            break;
        default:
            break;
    }
}

void Application::HandleKey(SDL_Keycode key)
{
    switch (key) {
        case SDLK_F:
            m_viewer->ZoomToPage();
            break;
        case SDLK_Z:
            m_viewer->ZoomToSelection();
            break;
        case SDLK_ESCAPE:
            m_viewer->Select(std::nullopt);
            break;
        case SDLK_N:
            ToggleNetHighlight();
            break;
        default:
            break;
    }
}

void Application::ToggleNetHighlight()
{
    auto* board_viewer = dynamic_cast<BoardViewer*>(m_viewer.get());
    if (board_viewer == nullptr) {
        return;
    }

    const Element* item = board_viewer->GetSelectedItem();
    if (item == nullptr || item->GetNetId() < 0) {
        board_viewer->ClearNetHighlight();
        return;
    }

    int const net = item->GetNetId();
    if (board_viewer->GetHighlightedNet() == net) {
        board_viewer->ClearNetHighlight();
    } else {
        board_viewer->HighlightNet(net);
    }
}

void Application::ResizeToWindow()
{
    m_viewer->Resize(m_window->GetPixelWidth(), m_window->GetPixelHeight());
}

void Application::HandleWindowEvent(WindowEventType event_type)
{
    switch (event_type) {
        case WindowEventType::kMinimized:
        case WindowEventType::kHidden:
            m_isMinimized = true;
            break;
        case WindowEventType::kRestored:
        case WindowEventType::kShown:
            m_isMinimized = false;
            m_viewer->Draw();
            break;
        case WindowEventType::kResized:
            ResizeToWindow();
            break;
    }
}
