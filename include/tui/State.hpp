#ifndef TUI_STATE_HPP
#define TUI_STATE_HPP

#include <cstdint>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class StateMachine;

// A screen driven by the state machine. Conversions keep running on their own
// thread, so Update() is called on every poll timeout as well as after input.
class State {
public:
    virtual ~State() = default;

    virtual void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Called when transitioning away, and once more when the loop ends.
    virtual void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    virtual void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    virtual void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Returns false to let the machine apply its global keys (Q quits); a state
    // editing text returns true for everything.
    virtual bool HandleInput(StateMachine& machine,
                             ncpp::NotCurses& nc,
                             ncpp::Plane& stdplane,
                             uint32_t input,
                             const ncinput& details) = 0;
};

#endif // TUI_STATE_HPP
