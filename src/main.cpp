#include "core/Application.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Include SDL_main.h to enable SDL's WinMain wrapper on Windows
#include <SDL3/SDL_main.h>

int main(int argc, char* args[])
{
    std::optional<std::string> document;
    if (argc > 1) {
        document = std::string(args[1]);
        if (*document != "board" && *document != "schematic") {
            std::cerr << "Usage: " << args[0] << " [board|schematic]" << std::endl;
            return 1;
        }
    }

    auto app = std::make_unique<Application>();

    if (!app->Initialize(document)) {
        // Initialization failed, Application::Initialize should have logged details.
        return 1;
    }

    app->Run();

    app->Shutdown();

    return 0;
}
