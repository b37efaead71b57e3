#include <clocale>
#include <memory>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

#include "converter/ConversionLog.hpp"
#include "tui/Signal.hpp"
#include "tui/Config.hpp"
#include "tui/StateMachine.hpp"
#include "tui/WelcomeScreen.hpp"
#include "tui/ConverterScreen.hpp"

namespace {
// Yes/No prompt on the bottom row; returns true for Yes.
bool ConfirmSave(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    bool save = true;
    while (!g_stop_requested.load(std::memory_order_relaxed)) {
        unsigned rows = 0;
        unsigned cols = 0;
        stdplane.get_dim(rows, cols);

        stdplane.erase();
        stdplane.perimeter_rounded(0, 0, 0);
        const int choice_row = static_cast<int>(rows) - 2;
        const std::string prompt = "Save configuration changes to file?";
        stdplane.putstr(choice_row, 2, prompt.c_str());
        const int yes_col = 2 + static_cast<int>(prompt.size()) + 4;
        const int no_col = yes_col + 8;
        if (save) {
            stdplane.set_bg_rgb8(255, 255, 255);
            stdplane.set_fg_rgb8(0, 0, 0);
        }
        stdplane.putstr(choice_row, yes_col, "Yes");
        stdplane.set_bg_default();
        stdplane.set_fg_default();
        if (!save) {
            stdplane.set_bg_rgb8(255, 255, 255);
            stdplane.set_fg_rgb8(0, 0, 0);
        }
        stdplane.putstr(choice_row, no_col, "No");
        stdplane.set_bg_default();
        stdplane.set_fg_default();
        nc.render();

        ncinput ni{};
        timespec ts{0, 500'000'000};
        const uint32_t ch = notcurses_get(nc, &ts, &ni);
        if (ch == 0 || ni.evtype == NCTYPE_RELEASE) {
            continue;
        }
        if (ch == 'q' || ch == 'Q' || ch == NCKEY_ESC || ch == static_cast<uint32_t>(-1)) {
            return false;
        }
        if (ch == 'y' || ch == 'Y') {
            return true;
        }
        if (ch == 'n' || ch == 'N') {
            return false;
        }
        if (ch == NCKEY_LEFT || ch == NCKEY_RIGHT || ch == '\t') {
            save = !save;
        } else if (ch == NCKEY_ENTER || ch == '\n' || ch == '\r') {
            return save;
        }
    }
    return false;
}
} // namespace

int main() {
    // Install SIGINT/SIGTERM handlers early so Ctrl-C can cleanly exit the loop.
    InitStopSignalHandlers();

    // Load converter configuration if present.
    ConverterConfig config;
    const std::filesystem::path config_path = std::filesystem::current_path() / "config" / "converter.yml";
    if (!config.LoadFromFile(config_path)) {
        std::cerr << "Warning: could not load config from " << config_path << "; using defaults.\n";
    }

    ConversionLog log;
    std::ofstream log_file;
    const std::string log_file_path = config.GetString("log_file", "");
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
        if (log_file.is_open()) {
            log.SetMirror(&log_file);
        } else {
            std::cerr << "Warning: could not open log file " << log_file_path << "\n";
        }
    }

    // Configure NotCurses and suppress the startup banner.
    notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
    nc_options.flags |= NCOPTION_SUPPRESS_BANNERS;
    std::unique_ptr<ncpp::NotCurses> nc;
    try {
        nc = std::make_unique<ncpp::NotCurses>(nc_options);
    } catch (const std::exception& e) {
        std::cerr << "Error: could not initialize the terminal: " << e.what() << "\n";
        return 1;
    }
    // notcurses adopts the user's locale for UTF-8 output; numbers handed to
    // ffmpeg and written to the config still need '.' decimals.
    std::setlocale(LC_NUMERIC, "C");

    bool config_changed = false;
    bool save_failed = false;
    JobCounts final_counts;
    {
        // Grab the root plane; it tracks the terminal size automatically.
        std::unique_ptr<ncpp::Plane> stdplane{nc->get_stdplane()};

        // Wire up the state machine with the initial welcome screen.
        StateMachine machine;
        auto welcome_state = std::make_shared<WelcomeScreen>(config, "converter");
        auto converter_state = std::make_shared<ConverterScreen>(config, config_changed, log);
        machine.AddState("welcome", welcome_state);
        machine.AddState("converter", converter_state);
        machine.TransitionTo("welcome", *nc, *stdplane);

        // Enter the main loop: draw, poll, and dispatch to the active state.
        machine.Run(*nc, *stdplane);
        final_counts = converter_state->Counts();

        // If configuration changed, prompt to save.
        if (config_changed && ConfirmSave(*nc, *stdplane)) {
            save_failed = !config.SaveToFile(config_path);
        }
    }

    // Restore the terminal before anything else is printed.
    nc->stop();
    nc.reset();
    log.SetMirror(nullptr);

    if (final_counts.Total() > 0) {
        std::cerr << final_counts.succeeded << " converted, " << final_counts.failed << " failed, "
                  << final_counts.skipped << " skipped, " << final_counts.queued << " not started.\n";
    }
    if (save_failed) {
        std::cerr << "Warning: failed to save config to " << config_path << "\n";
    }
    return 0;
}
