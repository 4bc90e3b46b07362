#include "gui_sdl/Application.hpp"

#include <chrono>
#include <stdexcept>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace stackfall::gui_sdl {

namespace {

constexpr Uint32 kSdlSubsystems = SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS;

[[noreturn]] void throwSdlError(const char* what) {
    throw std::runtime_error(std::string(what) + " failed: " + SDL_GetError());
}

} // namespace

Application::Application(const WindowSettings& settings) {
    if (SDL_Init(kSdlSubsystems) != 0) {
        throwSdlError("SDL_Init");
    }

    m_window = SDL_CreateWindow(
        settings.title.c_str(),
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        settings.width, settings.height,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );
    if (!m_window) {
        shutdown();
        throwSdlError("SDL_CreateWindow");
    }

    Uint32 rendererFlags = SDL_RENDERER_ACCELERATED;
    if (settings.vsync) {
        rendererFlags |= SDL_RENDERER_PRESENTVSYNC;
    }
    m_renderer = SDL_CreateRenderer(m_window, -1, rendererFlags);
    if (!m_renderer) {
        shutdown();
        throwSdlError("SDL_CreateRenderer");
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->AddFontDefault();
    io.IniFilename = nullptr; // no imgui.ini next to the binary

    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);
    m_imguiReady = true;

    m_running = true;
}

Application::~Application() {
    shutdown();
}

void Application::shutdown() {
    // Screens may hold SDL resources; drop them before the renderer goes.
    m_pending.reset();
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    if (SDL_WasInit(kSdlSubsystems)) {
        SDL_Quit();
    }
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    if (!m_screen) {
        m_screen = std::move(screen);
    } else {
        m_pending = std::move(screen);
    }
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0; h = 0;
    if (m_window) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::dispatch(const SDL_Event& e) {
    if (e.type == SDL_QUIT) {
        m_running = false;
        return;
    }
    if (!m_screen) {
        return;
    }

    if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
        m_screen->onFocusLost(*this);
    }
    m_screen->handleEvent(*this, e);
}

void Application::beginImGuiFrame() {
    // Clear first: the screen draws with SDL, ImGui overlays on top
    SDL_SetRenderDrawColor(m_renderer, 20, 20, 20, 255);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void Application::endImGuiFrame() {
    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    // The engine counts whole milliseconds; the remainder carries over.
    std::chrono::microseconds carry{0};

    SDL_Event e;
    while (m_running) {
        if (m_pending) {
            m_screen = std::move(m_pending);
        }

        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);
            dispatch(e);
        }

        const auto now = clock::now();
        carry += std::chrono::duration_cast<std::chrono::microseconds>(now - last);
        last = now;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(carry);
        carry -= elapsed;

        if (m_screen && m_running) {
            m_screen->update(*this, elapsed);
        }

        beginImGuiFrame();
        if (m_screen) {
            m_screen->render(*this);
        }
        endImGuiFrame();
    }

    return 0;
}

} // namespace stackfall::gui_sdl
