#include "gui_sdl/SinglePlayerScreen.hpp"

#include <algorithm>
#include <cstdint>
#include <cfloat>
#include <cstdio>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"

namespace stackfall::gui_sdl {

namespace core = stackfall::core;
namespace controller = stackfall::controller;

namespace {

constexpr std::size_t kFeedSize = 6;

ImU32 colorForTetromino(core::TetrominoType type)
{
    using core::TetrominoType;
    switch (type) {
        case TetrominoType::I: return IM_COL32(  0, 255, 255, 255);
        case TetrominoType::O: return IM_COL32(255, 255,   0, 255);
        case TetrominoType::T: return IM_COL32(160,  32, 240, 255);
        case TetrominoType::J: return IM_COL32(  0,   0, 255, 255);
        case TetrominoType::L: return IM_COL32(255, 165,   0, 255);
        case TetrominoType::S: return IM_COL32(  0, 255,   0, 255);
        case TetrominoType::Z: return IM_COL32(255,   0,   0, 255);
    }
    return IM_COL32(200, 200, 200, 255);
}

void setDrawColor(SDL_Renderer* renderer, ImU32 col)
{
    SDL_SetRenderDrawColor(renderer,
                           static_cast<Uint8>((col >> IM_COL32_R_SHIFT) & 0xFF),
                           static_cast<Uint8>((col >> IM_COL32_G_SHIFT) & 0xFF),
                           static_cast<Uint8>((col >> IM_COL32_B_SHIFT) & 0xFF),
                           static_cast<Uint8>((col >> IM_COL32_A_SHIFT) & 0xFF));
}

const char* phaseName(core::GamePhase phase)
{
    switch (phase) {
        case core::GamePhase::NotStarted: return "Not started";
        case core::GamePhase::Spawning:   return "Spawning";
        case core::GamePhase::Falling:    return "Falling";
        case core::GamePhase::Locking:    return "Locking";
        case core::GamePhase::Clearing:   return "Clearing";
        case core::GamePhase::Paused:     return "Paused";
        case core::GamePhase::GameOver:   return "Game over";
    }
    return "?";
}

const char* spinName(core::SpinType spin)
{
    switch (spin) {
        case core::SpinType::None: return "";
        case core::SpinType::Mini: return "Mini spin ";
        case core::SpinType::Full: return "Spin ";
    }
    return "";
}

} // namespace

SinglePlayerScreen::SinglePlayerScreen(const core::GameConfig& config)
    : session_(config)
    , controller_(session_)
{
    session_.start();
}

void SinglePlayerScreen::restart()
{
    session_.reset();
    session_.start();
    feed_.clear();
}

controller::InputSnapshot SinglePlayerScreen::readKeyboard()
{
    const Uint8* keys = SDL_GetKeyboardState(nullptr);

    controller::InputSnapshot in;
    in.moveLeft  = keys[SDL_SCANCODE_LEFT] || keys[SDL_SCANCODE_A];
    in.moveRight = keys[SDL_SCANCODE_RIGHT] || keys[SDL_SCANCODE_D];
    in.softDrop  = keys[SDL_SCANCODE_DOWN] || keys[SDL_SCANCODE_S];
    in.hardDrop  = keys[SDL_SCANCODE_SPACE];
    in.rotateCW  = keys[SDL_SCANCODE_X] || keys[SDL_SCANCODE_E] || keys[SDL_SCANCODE_UP];
    in.rotateCCW = keys[SDL_SCANCODE_Z] || keys[SDL_SCANCODE_Q];
    in.hold      = keys[SDL_SCANCODE_C] || keys[SDL_SCANCODE_LSHIFT];
    in.pause     = keys[SDL_SCANCODE_P] || keys[SDL_SCANCODE_ESCAPE];
    return in;
}

void SinglePlayerScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) {
        return;
    }

    switch (e.key.keysym.sym) {
        case SDLK_RETURN:
            if (session_.isGameOver()) {
                restart();
            }
            break;
        case SDLK_F10:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void SinglePlayerScreen::onFocusLost(Application&)
{
    session_.pause();
    pollEvents();
}

void SinglePlayerScreen::update(Application&, std::chrono::milliseconds elapsed)
{
    // ImGui owns the keyboard while a text widget has focus
    const controller::InputSnapshot input =
        ImGui::GetIO().WantCaptureKeyboard ? controller::InputSnapshot{} : readKeyboard();

    controller_.update(input, elapsed);
    pollEvents();
}

void SinglePlayerScreen::pollEvents()
{
    char line[96];
    for (const core::GameEvent& ev : session_.drainEvents()) {
        if (const auto* cleared = std::get_if<core::LinesClearedEvent>(&ev)) {
            std::snprintf(line, sizeof(line), "%s%d line%s +%llu%s%s",
                          spinName(cleared->spin), cleared->rows, cleared->rows == 1 ? "" : "s",
                          static_cast<unsigned long long>(cleared->points),
                          cleared->backToBack ? " (B2B)" : "",
                          cleared->combo > 1 ? " combo" : "");
        } else if (const auto* up = std::get_if<core::LevelUpEvent>(&ev)) {
            std::snprintf(line, sizeof(line), "Level %d", up->level);
        } else if (const auto* ended = std::get_if<core::GameEndedEvent>(&ev)) {
            std::snprintf(line, sizeof(line), "%s", ended->victory ? "Victory!" : "Topped out");
        } else {
            continue;
        }
        feed_.insert(feed_.begin(), line);
    }
    if (feed_.size() > kFeedSize) {
        feed_.resize(kFeedSize);
    }
}

SinglePlayerScreen::Layout SinglePlayerScreen::computeLayout(int windowW, int windowH,
                                                             const core::SessionSnapshot& snap) const
{
    Layout L{};
    const int rows = snap.rows - snap.hiddenRows;
    const int cols = snap.cols;

    const int margin = 20;

    const int usableW = windowW - margin * 3 - L.sideW;
    const int usableH = windowH - margin * 2;

    int cell = std::min(usableW / std::max(cols, 1), usableH / std::max(rows, 1));
    cell = std::clamp(cell, 12, 44);

    L.cell = cell;
    L.boardW = cols * cell;
    L.boardH = rows * cell;

    const int groupW = L.boardW + margin + L.sideW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);
    L.sideX = L.boardX + L.boardW + margin;
    return L;
}

void SinglePlayerScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const core::SessionSnapshot snap = session_.snapshot();
    const Layout L = computeLayout(winW, winH, snap);

    renderBoard(app.renderer(), snap, L);
    renderBoardOverlayText(snap, L);
    renderHUD(snap, L);
}

void SinglePlayerScreen::renderBoard(SDL_Renderer* renderer, const core::SessionSnapshot& snap,
                                     const Layout& L) const
{
    const int hidden = snap.hiddenRows;
    const int rows = snap.rows - hidden;
    const int cols = snap.cols;
    const int cs = L.cell;

    // Board row r is drawn at screen row r - hidden; the buffer rows stay off screen.
    auto cellRect = [&](int row, int col, int inset) {
        return SDL_Rect{L.boardX + col * cs + inset, L.boardY + (row - hidden) * cs + inset,
                        cs - inset * 2, cs - inset * 2};
    };

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{L.boardX, L.boardY, L.boardW, L.boardH};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= rows; ++r) {
        SDL_RenderDrawLine(renderer, L.boardX, L.boardY + r * cs, L.boardX + L.boardW, L.boardY + r * cs);
    }
    for (int c = 0; c <= cols; ++c) {
        SDL_RenderDrawLine(renderer, L.boardX + c * cs, L.boardY, L.boardX + c * cs, L.boardY + L.boardH);
    }

    for (int r = hidden; r < snap.rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const auto& t = snap.at(r, c);
            if (!t) continue;
            setDrawColor(renderer, colorForTetromino(*t));
            SDL_Rect rect = cellRect(r, c, 1);
            SDL_RenderFillRect(renderer, &rect);
        }
    }

    if (snap.ghost) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, 70);
        for (const auto& b : snap.ghost->blocks()) {
            if (b.row < hidden) continue;
            SDL_Rect rect = cellRect(b.row, b.col, 2);
            SDL_RenderDrawRect(renderer, &rect);
        }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }

    if (snap.active) {
        setDrawColor(renderer, colorForTetromino(snap.active->type()));
        for (const auto& b : snap.active->blocks()) {
            if (b.row < hidden) continue;
            SDL_Rect rect = cellRect(b.row, b.col, 1);
            SDL_RenderFillRect(renderer, &rect);
        }
    }

    if (snap.phase == core::GamePhase::Paused || snap.phase == core::GamePhase::GameOver) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void SinglePlayerScreen::renderBoardOverlayText(const core::SessionSnapshot& snap, const Layout& L) const
{
    if (snap.phase != core::GamePhase::Paused && snap.phase != core::GamePhase::GameOver) return;

    const bool paused = snap.phase == core::GamePhase::Paused;
    const bool victory = session_.summary().victory;
    const char* msg = paused ? "PAUSED" : (victory ? "VICTORY" : "GAME OVER");
    const char* hint = paused ? "Press P or ESC to resume" : "Press Enter to play again";

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;

    const float scale = std::clamp(L.cell / 28.0f, 0.75f, 1.25f);
    const float cardW = std::min(420.0f * scale, L.boardW * 0.90f);
    const float cardH = 100.0f * scale;

    dl->AddRectFilled(ImVec2(cx - cardW * 0.5f, cy - cardH * 0.5f),
                      ImVec2(cx + cardW * 0.5f, cy + cardH * 0.5f),
                      IM_COL32(0, 0, 0, 175), 10.0f);

    ImFont* font = ImGui::GetFont();
    const float bigSize = ImGui::GetFontSize() * 2.0f * scale;
    const ImVec2 tSize = font->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg);
    dl->AddText(font, bigSize, ImVec2(cx - tSize.x * 0.5f, cy - 34.0f * scale),
                IM_COL32(255, 255, 255, 255), msg);

    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 14.0f * scale), IM_COL32(220, 220, 220, 255), hint);
}

void SinglePlayerScreen::renderPieceWindow(const char* title, int x, int y, int w, int h,
                                           const std::vector<core::TetrominoType>& pieces,
                                           bool dimmed) const
{
    ImGui::SetNextWindowPos(ImVec2(static_cast<float>(x), static_cast<float>(y)), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(static_cast<float>(w), static_cast<float>(h)), ImGuiCond_Always);
    ImGui::Begin(title, nullptr,
                 ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove);

    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();

    // One 4x2 slot per piece, stacked vertically
    const float slotW = static_cast<float>(w) - 24.0f;
    const float cell = std::min(slotW / 4.5f, 18.0f);
    const float slotH = cell * 2.0f + 10.0f;

    for (std::size_t i = 0; i < pieces.size(); ++i) {
        const auto& shape = core::Tetromino::shapeFor(pieces[i], core::Rotation::R0);
        int minR = shape[0].row, maxR = shape[0].row;
        int minC = shape[0].col, maxC = shape[0].col;
        for (const auto& b : shape) {
            minR = std::min(minR, b.row); maxR = std::max(maxR, b.row);
            minC = std::min(minC, b.col); maxC = std::max(maxC, b.col);
        }

        const float pieceW = (maxC - minC + 1) * cell;
        const float ox = origin.x + (slotW - pieceW) * 0.5f - minC * cell;
        const float oy = origin.y + i * slotH - minR * cell;

        ImU32 col = colorForTetromino(pieces[i]);
        if (dimmed) col = (col & ~IM_COL32_A_MASK) | (90u << IM_COL32_A_SHIFT);

        for (const auto& b : shape) {
            const float bx = ox + b.col * cell;
            const float by = oy + b.row * cell;
            dl->AddRectFilled(ImVec2(bx + 1, by + 1), ImVec2(bx + cell - 1, by + cell - 1), col);
        }
    }

    ImGui::Dummy(ImVec2(slotW, slotH * static_cast<float>(std::max<std::size_t>(pieces.size(), 1))));
    ImGui::End();
}

void SinglePlayerScreen::renderHUD(const core::SessionSnapshot& snap, const Layout& L)
{
    const int margin = 12;
    int y = L.boardY;

    ImGui::SetNextWindowPos(ImVec2(static_cast<float>(L.sideX), static_cast<float>(y)), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2(static_cast<float>(L.sideW), 0.0f),
                                        ImVec2(static_cast<float>(L.sideW), 400.0f));
    ImGui::Begin("Stackfall", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", static_cast<unsigned long long>(snap.score));
    ImGui::Text("Level: %d", snap.level);
    ImGui::Text("Lines: %llu", static_cast<unsigned long long>(snap.linesCleared));
    ImGui::Text("Pieces: %d", session_.lockedPieces());

    ImGui::Separator();
    if (snap.phase == core::GamePhase::GameOver) {
        ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Status: %s", phaseName(snap.phase));
        if (ImGui::Button("Restart", ImVec2(-1, 0))) {
            restart();
        }
    } else if (snap.phase == core::GamePhase::Paused) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Status: %s", phaseName(snap.phase));
    } else {
        ImGui::Text("Status: %s", phaseName(snap.phase));
    }

    ImGui::Separator();
    for (const auto& line : feed_) {
        ImGui::TextUnformatted(line.c_str());
    }

    const float hudH = ImGui::GetWindowHeight();
    ImGui::End();

    y += static_cast<int>(hudH) + margin;

    if (session_.config().holdEnabled) {
        std::vector<core::TetrominoType> held;
        if (snap.hold) held.push_back(*snap.hold);
        const int holdH = 80;
        renderPieceWindow("Hold", L.sideX, y, L.sideW, holdH, held, !snap.holdAvailable);
        y += holdH + margin;
    }

    if (!snap.preview.empty()) {
        const int previewH = 40 + static_cast<int>(snap.preview.size()) * 46;
        renderPieceWindow("Next", L.sideX, y, L.sideW, previewH, snap.preview, false);
    }
}

} // namespace stackfall::gui_sdl
