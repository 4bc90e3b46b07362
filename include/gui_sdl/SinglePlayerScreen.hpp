#pragma once

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"
#include "core/GameSession.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"

#include <string>
#include <vector>

namespace stackfall::gui_sdl {

class SinglePlayerScreen final : public Screen {
public:
    explicit SinglePlayerScreen(const stackfall::core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, std::chrono::milliseconds elapsed) override;
    void render(Application& app) override;
    void onFocusLost(Application& app) override;

private:
    struct Layout {
        int cell = 28;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        int sideX = 0; // right column: HUD, hold, preview
        int sideW = 240;
    };

    // Rendering helpers
    void renderBoard(SDL_Renderer* renderer, const stackfall::core::SessionSnapshot& snap,
                     const Layout& L) const;
    void renderBoardOverlayText(const stackfall::core::SessionSnapshot& snap, const Layout& L) const;
    void renderHUD(const stackfall::core::SessionSnapshot& snap, const Layout& L);
    void renderPieceWindow(const char* title, int x, int y, int w, int h,
                           const std::vector<stackfall::core::TetrominoType>& pieces,
                           bool dimmed) const;

    Layout computeLayout(int windowW, int windowH, const stackfall::core::SessionSnapshot& snap) const;

    static stackfall::controller::InputSnapshot readKeyboard();

    void restart();
    void pollEvents();

    stackfall::core::GameSession session_;
    stackfall::controller::GameController controller_;

    // Last few notable events, newest first, shown in the HUD
    std::vector<std::string> feed_;
};

} // namespace stackfall::gui_sdl
