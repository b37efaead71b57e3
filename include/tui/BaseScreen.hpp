#ifndef TUI_BASESCREEN_HPP
#define TUI_BASESCREEN_HPP

#include <string>
#include <utility>
#include <vector>

#include <ncpp/Plane.hh>

#include "tui/State.hpp"

// Smallest terminal a screen can lay itself out in.
struct ScreenSize {
    unsigned rows = 0;
    unsigned cols = 0;
};

// Common drawing for full-screen states: the outer frame, centered text and
// the key hint line on the bottom border.
class BaseScreen : public State {
public:
    // Key and what it does, e.g. {"Tab", "next pane"}.
    using KeyHints = std::vector<std::pair<std::string, std::string>>;

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}
    void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}
    void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}

    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override = 0;
    bool HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     uint32_t input,
                     const ncinput& details) override = 0;

protected:
    // Clears the plane, draws the rounded outer border and centers title on it.
    void DrawFrame(ncpp::Plane& plane, const std::string& title);
    // Writes each line centered vertically around mid-row (does not clear).
    void CenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines);
    void PutCentered(ncpp::Plane& plane, int row, const std::string& text);
    // Hints that do not fit the width are dropped from the end.
    void DrawKeyHints(ncpp::Plane& plane, const KeyHints& hints);
    // When the plane is smaller than needed, replaces the frame with a notice
    // and returns false.
    bool CheckMinimumSize(ncpp::Plane& plane, const ScreenSize& needed);
};

#endif // TUI_BASESCREEN_HPP
