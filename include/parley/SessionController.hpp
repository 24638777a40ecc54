/**
 * SessionController.hpp - Wake -> converse -> idle lifecycle
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/Session.hpp"
#include "parley/Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace parley {

namespace core {
class InteractionCycle;
class FollowUpListener;
}

enum class ControllerState {
    WaitingForWake,
    InSession,
    ListeningForFollowUp,
    Shutdown
};

const char* stateName(ControllerState state);

struct ControllerOptions {
    std::chrono::milliseconds follow_up_timeout{12000};
    std::string preset_session_id;   // empty -> random id per session
};

struct ControllerCallbacks {
    std::function<void(ControllerState)> onStateChange;
    std::function<void(const TurnResult&)> onTurnComplete;
};

/**
 * Top-level loop. Blocks in run() until the wake detector requests shutdown.
 *
 * After a wake, turns repeat without a new wake word: immediately after a
 * barge-in, or after speech inside the follow-up window. A follow-up timeout
 * or a backend failure ends the session and returns to waiting for wake.
 * Unexpected exceptions are logged with context and rethrown.
 */
class SessionController {
public:
    SessionController(WakeWordDetector& wake,
                      core::InteractionCycle& cycle,
                      core::FollowUpListener& follow_up,
                      ControllerOptions options = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void run();

    ControllerState state() const;

    /// Active session, nullptr between sessions.
    const Session* session() const;

    void setCallbacks(ControllerCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
