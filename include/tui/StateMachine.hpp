#ifndef TUI_STATEMACHINE_HPP
#define TUI_STATEMACHINE_HPP

#include <ctime>
#include <memory>
#include <string>
#include <unordered_map>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class State;

// Owns the registered screens and the input loop. The loop never blocks for
// longer than the poll interval, so screens can show progress made by
// background work without waiting for a key.
class StateMachine {
public:
    // poll_interval_ms bounds how long a frame waits for input before redrawing,
    // which is also how often background progress shows up on screen.
    explicit StateMachine(long poll_interval_ms = 100);
    ~StateMachine();

    void AddState(const std::string& name, std::shared_ptr<State> state);
    // Returns false when no state is registered under name.
    bool TransitionTo(const std::string& name, ncpp::NotCurses& nc, ncpp::Plane& stdplane);

    void RequestStop();

    // Runs the main loop: draw, poll input, and dispatch to the active state.
    void Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane);

private:
    std::unordered_map<std::string, std::shared_ptr<State>> states_;
    std::shared_ptr<State> current_state_;
    timespec poll_timeout_;
    bool running_;
};

#endif // TUI_STATEMACHINE_HPP
