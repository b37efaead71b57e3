#include "tui/WelcomeScreen.hpp"

#include <utility>
#include <vector>

#include <notcurses/notcurses.h>

#include "converter/Process.hpp"
#include "tui/StateMachine.hpp"

WelcomeScreen::WelcomeScreen(const ConverterConfig& config, std::string next_state)
    : config_(config), next_state_(std::move(next_state)) {}

void WelcomeScreen::Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    // Resolve once per visit; the converter screen re-checks when the path changes.
    ffmpeg_location_ = FindExecutable(config_.GetString("ffmpeg_path", "ffmpeg"));
}

void WelcomeScreen::Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    DrawFrame(stdplane, "");

    std::vector<std::string> lines{
        "Opus to MP3 Converter",
        "",
        "Converts .opus files to .mp3 with ffmpeg, with optional loudness normalization.",
        "",
    };
    if (ffmpeg_location_.empty()) {
        lines.push_back("ffmpeg was not found. Set ffmpeg_path in the settings before converting.");
    } else {
        lines.push_back("Using ffmpeg at " + ffmpeg_location_);
    }
    CenterLines(stdplane, lines);
    DrawKeyHints(stdplane, {{"Enter", "continue"}, {"Q", "quit"}});
}

bool WelcomeScreen::HandleInput(StateMachine& machine,
                                ncpp::NotCurses& nc,
                                ncpp::Plane& stdplane,
                                uint32_t input,
                                const ncinput& details) {
    (void)details;
    if (input == NCKEY_ENTER || input == '\n' || input == '\r' || input == ' ') {
        if (!machine.TransitionTo(next_state_, nc, stdplane)) {
            machine.RequestStop();
        }
        return true;
    }
    // Q falls through to the state machine.
    return false;
}
