#pragma once

#include <SDL.h>

#include <chrono>

namespace stackfall::gui_sdl {

class Application;

// One full-window view driven by Application::run.
class Screen {
public:
    virtual ~Screen() = default;

    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Whole milliseconds of wall time since the previous frame.
    virtual void update(Application& app, std::chrono::milliseconds elapsed) = 0;

    // SDL drawing first, ImGui widgets on top.
    virtual void render(Application& app) = 0;

    // The window lost keyboard focus.
    virtual void onFocusLost(Application&) {}
};

} // namespace stackfall::gui_sdl
