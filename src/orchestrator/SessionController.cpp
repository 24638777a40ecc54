/**
 * SessionController.cpp - Main conversation loop controller
 *
 * WaitingForWake -> InSession -> (ListeningForFollowUp -> InSession)* -> WaitingForWake
 */

#include "parley/SessionController.hpp"
#include "parley/core/FollowUpListener.hpp"
#include "parley/core/InteractionCycle.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <optional>
#include <utility>

namespace parley {

const char* stateName(ControllerState state) {
    switch (state) {
        case ControllerState::WaitingForWake:       return "WAITING_FOR_WAKE";
        case ControllerState::InSession:            return "IN_SESSION";
        case ControllerState::ListeningForFollowUp: return "LISTENING_FOR_FOLLOWUP";
        case ControllerState::Shutdown:             return "SHUTDOWN";
    }
    return "UNKNOWN";
}

struct SessionController::Impl {
    WakeWordDetector& wake;
    core::InteractionCycle& cycle;
    core::FollowUpListener& follow_up;
    ControllerOptions options;
    ControllerCallbacks callbacks;

    std::atomic<ControllerState> state{ControllerState::WaitingForWake};
    std::optional<Session> session;

    Impl(WakeWordDetector& w, core::InteractionCycle& c, core::FollowUpListener& f, ControllerOptions o)
        : wake(w), cycle(c), follow_up(f), options(std::move(o)) {}

    void setState(ControllerState new_state) {
        state = new_state;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(new_state);
        }
    }

    void endSession() {
        session.reset();
        setState(ControllerState::WaitingForWake);
    }

    void run() {
        setState(ControllerState::WaitingForWake);
        std::cout << "[SessionController] Assistant ready" << std::endl;

        while (state != ControllerState::Shutdown) {
            try {
                step();
            } catch (const std::exception& e) {
                std::cerr << "[SessionController] Unrecoverable error in state " << stateName(state)
                          << " (session " << (session ? session->id() : std::string("none")) << "): "
                          << e.what() << std::endl;
                session.reset();
                setState(ControllerState::Shutdown);
                throw;
            }
        }

        std::cout << "[SessionController] Stopped" << std::endl;
    }

    void step() {
        switch (state.load()) {
            case ControllerState::WaitingForWake:
                waitForWake();
                break;

            case ControllerState::InSession:
                runTurn();
                break;

            case ControllerState::ListeningForFollowUp:
                listenForFollowUp();
                break;

            case ControllerState::Shutdown:
                break;
        }
    }

    void waitForWake() {
        std::cout << "[SessionController] Waiting for wake word..." << std::endl;
        if (!wake.awaitWake()) {
            std::cout << "[SessionController] Wake detector requested shutdown" << std::endl;
            setState(ControllerState::Shutdown);
            return;
        }

        session.emplace(options.preset_session_id);
        std::cout << "[SessionController] Woken - session " << session->id() << std::endl;
        setState(ControllerState::InSession);
    }

    void runTurn() {
        TurnResult result = cycle.run(*session);

        if (callbacks.onTurnComplete) {
            callbacks.onTurnComplete(result);
        }

        if (result.isAborted()) {
            std::cerr << "[SessionController] Backend failure, ending session: " << result.error << std::endl;
            endSession();
        } else if (result.interrupted) {
            // User is already talking: no wake word, no follow-up wait
            std::cout << "[SessionController] Interrupted - listening again" << std::endl;
            setState(ControllerState::InSession);
        } else {
            setState(ControllerState::ListeningForFollowUp);
        }
    }

    void listenForFollowUp() {
        auto seconds = std::chrono::duration<double>(options.follow_up_timeout).count();
        std::cout << "[SessionController] Listening for follow-up (" << seconds << "s)..." << std::endl;

        if (follow_up.listen(options.follow_up_timeout)) {
            setState(ControllerState::InSession);
        } else {
            std::cout << "[SessionController] No follow-up detected, returning to wake word" << std::endl;
            endSession();
        }
    }
};

SessionController::SessionController(WakeWordDetector& wake,
                                     core::InteractionCycle& cycle,
                                     core::FollowUpListener& follow_up,
                                     ControllerOptions options)
    : impl_(std::make_unique<Impl>(wake, cycle, follow_up, std::move(options))) {
}

SessionController::~SessionController() = default;

void SessionController::run() { impl_->run(); }

ControllerState SessionController::state() const { return impl_->state; }

const Session* SessionController::session() const {
    return impl_->session ? &*impl_->session : nullptr;
}

void SessionController::setCallbacks(ControllerCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

} // namespace parley
