#ifndef TUI_WELCOMESCREEN_HPP
#define TUI_WELCOMESCREEN_HPP

#include <string>

#include "tui/BaseScreen.hpp"
#include "tui/Config.hpp"

// First screen shown to the user: reports whether ffmpeg can be found and
// leads to the converter.
class WelcomeScreen : public BaseScreen {
public:
    WelcomeScreen(const ConverterConfig& config, std::string next_state);

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    bool HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     uint32_t input,
                     const ncinput& details) override;

private:
    const ConverterConfig& config_;
    std::string next_state_;
    std::string ffmpeg_location_;
};

#endif // TUI_WELCOMESCREEN_HPP
