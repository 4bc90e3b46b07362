#include "gui_sdl/Application.hpp"
#include "gui_sdl/SinglePlayerScreen.hpp"
#include "core/GameConfig.hpp"

#include <cstdio>
#include <exception>
#include <memory>

int main(int, char**) {
    stackfall::core::GameConfig config;

    try {
        // Reject a bad configuration before a window opens
        config.validate();

        stackfall::gui_sdl::WindowSettings window;
        window.title = "Stackfall";

        stackfall::gui_sdl::Application app{window};
        app.setScreen(std::make_unique<stackfall::gui_sdl::SinglePlayerScreen>(config));
        return app.run();
    } catch (const stackfall::core::ConfigError& e) {
        std::fprintf(stderr, "[CONFIG] %s\n", e.what());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[SDL] %s\n", e.what());
    }
    return 1;
}
