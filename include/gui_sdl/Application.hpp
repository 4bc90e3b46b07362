#pragma once

#include <memory>
#include <string>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"

namespace stackfall::gui_sdl {

struct WindowSettings {
    std::string title{"Stackfall"};
    int width{900};
    int height{760};
    bool vsync{true};
};

// Owns the SDL window, renderer and the ImGui context for the lifetime of
// the object. Construction throws std::runtime_error when SDL cannot start.
class Application {
public:
    explicit Application(const WindowSettings& settings);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Main loop: events, update with the elapsed wall time, render.
    int run();

    void requestQuit() { m_running = false; }

    // Takes effect between frames, so a screen may replace itself.
    void setScreen(std::unique_ptr<Screen> screen);

    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    void getWindowSize(int& w, int& h) const;

private:
    void shutdown();
    void dispatch(const SDL_Event& e);
    void beginImGuiFrame();
    void endImGuiFrame();

private:
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
    std::unique_ptr<Screen> m_pending;
};

} // namespace stackfall::gui_sdl
