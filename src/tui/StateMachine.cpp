#include "tui/StateMachine.hpp"

#include <cstdint>
#include <notcurses/notcurses.h>

#include "tui/Signal.hpp"
#include "tui/State.hpp"

StateMachine::StateMachine(long poll_interval_ms)
    : current_state_(nullptr),
      poll_timeout_{poll_interval_ms / 1000, (poll_interval_ms % 1000) * 1'000'000},
      running_(true) {}

StateMachine::~StateMachine() = default;

void StateMachine::AddState(const std::string& name, std::shared_ptr<State> state) {
    states_[name] = std::move(state);
}

bool StateMachine::TransitionTo(const std::string& name, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    auto it = states_.find(name);
    if (it == states_.end()) {
        return false;
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }

    current_state_ = it->second;
    current_state_->Enter(*this, nc, stdplane);
    return true;
}

void StateMachine::RequestStop() {
    running_ = false;
}

void StateMachine::Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    running_ = true;

    while (running_ && current_state_ != nullptr) {
        // Always redraw before polling for input so the frame stays fresh.
        current_state_->Draw(*this, nc, stdplane);
        nc.render();

        ncinput input_details{};
        const uint32_t ch = notcurses_get(nc, &poll_timeout_, &input_details);

        if (g_stop_requested.load(std::memory_order_relaxed)) {
            running_ = false;
            break;
        }

        if (ch == 0) {
            // Timeout: give the state a chance to pick up background work.
            current_state_->Update(*this, nc, stdplane);
            continue;
        }

        if (ch == static_cast<uint32_t>(-1)) {
            // Input error from notcurses_get; bail out to restore the terminal.
            running_ = false;
            break;
        }

        // Key releases would otherwise double every keystroke on kitty-protocol terminals.
        if (input_details.evtype == NCTYPE_RELEASE) {
            continue;
        }
        // notcurses has already resized the standard plane; the next pass redraws.
        if (ch == NCKEY_RESIZE) {
            continue;
        }

        const bool consumed = current_state_->HandleInput(*this, nc, stdplane, ch, input_details);
        if (!consumed && (ch == 'q' || ch == 'Q')) {
            running_ = false;
            break;
        }
        current_state_->Update(*this, nc, stdplane);
    }

    // Give the active state a final chance to clean up.
    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }
}

