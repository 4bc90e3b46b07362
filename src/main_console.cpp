#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "core/GameConfig.hpp"
#include "core/GameSession.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

using namespace stackfall::core;

namespace {

const char* phaseName(GamePhase phase) {
    switch (phase) {
    case GamePhase::NotStarted: return "NotStarted";
    case GamePhase::Spawning:   return "Spawning";
    case GamePhase::Falling:    return "Falling";
    case GamePhase::Locking:    return "Locking";
    case GamePhase::Clearing:   return "Clearing";
    case GamePhase::Paused:     return "Paused";
    case GamePhase::GameOver:   return "GameOver";
    }
    return "?";
}

std::string typeList(const std::vector<TetrominoType>& types) {
    std::string out;
    for (TetrominoType t : types) {
        if (!out.empty()) out += ' ';
        out += tetrominoLabel(t);
    }
    return out.empty() ? "-" : out;
}

// Render the visible part of the board with the active piece, its ghost and
// the side panel (hold + preview) as ASCII.
void printSession(const SessionSnapshot& snap) {
    const int hidden = snap.hiddenRows;
    const int rows = snap.rows - hidden;
    const int cols = snap.cols;

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (const auto& t = snap.at(r + hidden, c)) {
                lines[r][c] = tetrominoLabel(*t);
            }
        }
    }

    auto overlay = [&](const Tetromino& piece, char mark) {
        for (const auto& b : piece.blocks()) {
            const int r = b.row - hidden;
            if (r >= 0 && r < rows && b.col >= 0 && b.col < cols) {
                lines[r][b.col] = mark;
            }
        }
    };
    if (snap.ghost) overlay(*snap.ghost, ':');
    if (snap.active) overlay(*snap.active, 'X');

    std::cout << "\n==== STACKFALL ====\n";
    std::cout << "Score: " << snap.score
              << " | Level: " << snap.level
              << " | Lines: " << snap.linesCleared
              << " | Phase: " << phaseName(snap.phase) << '\n';
    std::cout << "Hold: " << (snap.hold ? std::string(1, tetrominoLabel(*snap.hold)) : std::string("-"))
              << (snap.holdAvailable ? "" : " (used)")
              << " | Next: " << typeList(snap.preview) << '\n';

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (const auto& line : lines) {
        std::cout << '|' << line << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, s = soft drop, w = rotate CW, q = rotate CCW\n"
              << "  h = hard drop, c = hold, g = gravity step\n"
              << "  p = pause/resume, r = reset+start, x = quit\n";
}

void logEvents(GameSession& session) {
    for (const GameEvent& ev : session.drainEvents()) {
        if (const auto* cleared = std::get_if<LinesClearedEvent>(&ev)) {
            std::cout << "[SESSION] cleared " << cleared->rows << " row(s)"
                      << (cleared->wasSpin ? " with a spin" : "")
                      << (cleared->backToBack ? ", back-to-back" : "")
                      << (cleared->combo > 1 ? ", combo " + std::to_string(cleared->combo) : std::string())
                      << ", +" << cleared->points << '\n';
        } else if (const auto* up = std::get_if<LevelUpEvent>(&ev)) {
            std::cout << "[SESSION] level up -> " << up->level << '\n';
        } else if (const auto* held = std::get_if<HoldUsedEvent>(&ev)) {
            std::cout << "[SESSION] holding " << tetrominoLabel(held->stored) << '\n';
        } else if (const auto* ended = std::get_if<GameEndedEvent>(&ev)) {
            std::cout << "[SESSION] game ended" << (ended->victory ? " in victory" : "") << '\n';
        }
    }
}

} // namespace

int main() {
    try {
        GameConfig config;
        config.lineClearDelayMs = 0; // no animation to wait for in a console

        GameSession session{config};
        stackfall::controller::GameController controller{session};

        session.start();

        std::string cmd;
        printSession(session.snapshot());

        while (true) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, cmd)) {
                break; // EOF
            }
            if (cmd.empty()) {
                continue;
            }

            const char c = cmd[0];
            if (c == 'x' || c == 'X') {
                std::cout << "Quitting.\n";
                break;
            }

            using stackfall::controller::InputAction;

            switch (c) {
            case 'a': case 'A':
                controller.handleAction(InputAction::MoveLeft);
                break;
            case 'd': case 'D':
                controller.handleAction(InputAction::MoveRight);
                break;
            case 's': case 'S':
                controller.handleAction(InputAction::SoftDrop);
                break;
            case 'w': case 'W':
                controller.handleAction(InputAction::RotateCW);
                break;
            case 'q': case 'Q':
                controller.handleAction(InputAction::RotateCCW);
                break;
            case 'h': case 'H':
                controller.handleAction(InputAction::HardDrop);
                break;
            case 'c': case 'C':
                controller.handleAction(InputAction::Hold);
                break;
            case 'g': case 'G':
                controller.update(stackfall::controller::GameController::Duration{session.gravityIntervalMs()});
                break;
            case 'p': case 'P':
                controller.handleAction(InputAction::PauseResume);
                break;
            case 'r': case 'R':
                session.reset();
                session.start();
                break;
            default:
                std::cout << "Unknown command: " << c << '\n';
                break;
            }

            logEvents(session);
            printSession(session.snapshot());

            if (session.isGameOver()) {
                const SessionSummary s = session.summary();
                std::cout << "[SESSION] final score " << s.score << ", " << s.lines << " lines, "
                          << s.piecesLocked << " pieces, " << s.tetrises << " tetrises, "
                          << s.spins << " spins, max combo " << s.maxCombo << '\n';
                std::cout << "GAME OVER. Press 'r' to restart or 'x' to quit.\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] " << e.what() << '\n';
        return 1;
    }

    return 0;
}
