#pragma once

#include "core/GameSession.hpp"
#include "controller/InputAction.hpp"
#include <chrono>

namespace stackfall::controller {

class GameController {
public:
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the GameSession; caller keeps it alive.
    explicit GameController(stackfall::core::GameSession& session);

    /// Handle a single discrete player action (e.g. one typed command),
    /// bypassing DAS/ARR.
    void handleAction(InputAction action);

    // Frame-driven input: held buttons plus the time since the previous frame.
    void update(const InputSnapshot& input, Duration elapsed);

    // Let time pass with every button released.
    void update(Duration elapsed);

private:
    stackfall::core::GameSession& session_;
};

} // namespace stackfall::controller
