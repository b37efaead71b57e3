#ifndef TUI_CONVERTERSCREEN_HPP
#define TUI_CONVERTERSCREEN_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "converter/BatchRunner.hpp"
#include "converter/ConversionLog.hpp"
#include "converter/Job.hpp"
#include "converter/OpusToMp3Converter.hpp"
#include "tui/BaseScreen.hpp"
#include "tui/Config.hpp"
#include "tui/FileBrowser.hpp"
#include "tui/Subframe.hpp"

// Main screen: file browser, job queue, settings, summary and a command bar
// with the conversion log. Conversions run on the BatchRunner worker; this
// screen only polls the queue and the log when it redraws.
class ConverterScreen : public BaseScreen {
public:
    ConverterScreen(ConverterConfig& config, bool& config_changed, ConversionLog& log);
    ~ConverterScreen() override;

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    bool HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     uint32_t input,
                     const ncinput& details) override;

    JobCounts Counts() const { return jobs_.Counts(); }

private:
    enum class Focus {
        Files,
        Queue,
        Settings,
        Summary,
        Commands
    };

    enum class Slot {
        TopLeft,
        TopRight,
        MidLeft,
        MidRight,
        Footer
    };

    // Subframe placed in one of the five layout slots.
    class Pane : public Subframe {
    public:
        Pane(std::string title, Slot slot);

    protected:
        void ComputeGeometry(unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols) override;

    private:
        Slot slot_;
    };

    class FileSubframe : public Pane {
    public:
        explicit FileSubframe(const AudioConverter& converter);

        bool HandleInput(uint32_t input, const ncinput& details) override;
        bool Open(const std::filesystem::path& dir);
        void RefreshListing() { browser_.Load(browser_.CurrentPath()); }
        const FileBrowser::Entry* SelectedEntry() const { return browser_.SelectedEntry(); }
        std::filesystem::path SelectedPath() const { return browser_.SelectedPath(); }
        std::filesystem::path CurrentPath() const { return browser_.CurrentPath(); }

    protected:
        void DrawContents() override;

    private:
        FileBrowser browser_;
        int scroll_offset_ = 0;
        int horizontal_offset_ = 0;
    };

    class QueueSubframe : public Pane {
    public:
        QueueSubframe(const JobQueue& jobs, const BatchRunner& runner);

        bool HandleInput(uint32_t input, const ncinput& details) override;
        std::optional<std::uint64_t> SelectedJobId() const;

    protected:
        void DrawContents() override;

    private:
        void DrawProgressBar(const ContentArea& area, const BatchProgress& progress);
        static std::string JobLabel(const Job& job, const BatchProgress& progress);

        const JobQueue& jobs_;
        const BatchRunner& runner_;
        int selected_index_ = 0;
        int scroll_offset_ = 0;
        int horizontal_offset_ = 0;
    };

    class SettingsSubframe : public Pane {
    public:
        SettingsSubframe(ConverterConfig& config, bool& config_changed);

        bool HandleInput(uint32_t input, const ncinput& details) override;
        // True while a value is being typed or toggled; every key belongs to the editor then.
        bool Editing() const { return mode_ == Mode::EditBool || mode_ == Mode::EditValue; }

    protected:
        void DrawContents() override;

    private:
        enum class Mode { Submenus, Options, EditBool, EditValue };

        struct Option {
            std::string key;
            std::string label;
            enum class Type { Bool, Int, Double, String } type;
            std::string fallback;
            // Accepted range for numbers; ignored when min >= max.
            double min = 0.0;
            double max = 0.0;
        };

        const Option* SelectedOption() const;
        std::string ValueText(const Option& option) const;
        void DrawEditLine(const ContentArea& area);
        void EnterOptions();
        void EnterSubmenus();
        void BeginEdit(const Option& option);
        void CommitBool();
        void CommitValue();
        bool AcceptsChar(const Option& option, uint32_t input) const;

        ConverterConfig& config_;
        bool& config_changed_;
        Mode mode_ = Mode::Submenus;
        int submenu_index_ = 0;
        int option_index_ = 0;
        int scroll_offset_ = 0;
        bool bool_choice_ = true;
        std::string edit_buffer_;
        std::string edit_error_;
        std::vector<Option> current_options_;
        const std::vector<std::string> submenu_titles_{"General", "MP3 encoder", "Loudness normalization", "Metadata"};
    };

    class SummarySubframe : public Pane {
    public:
        SummarySubframe(const ConverterConfig& config, const JobQueue& jobs, const BatchRunner& runner);

        // Re-resolves the ffmpeg executable when the configured path changed.
        void Refresh();

    protected:
        void DrawContents() override;

    private:
        const ConverterConfig& config_;
        const JobQueue& jobs_;
        const BatchRunner& runner_;
        std::string resolved_for_;
        std::string ffmpeg_location_;
        bool resolved_ = false;
    };

    class CommandSubframe : public Pane {
    public:
        explicit CommandSubframe(const ConversionLog& log);

        bool HandleInput(uint32_t input, const ncinput& details) override;
        const std::string& SelectedCommand() const { return commands_[static_cast<std::size_t>(selected_index_)]; }
        void ScrollToEnd() { log_offset_ = 0; }

    protected:
        void DrawContents() override;

    private:
        void DrawLog(const ContentArea& area);
        void DrawCommands(const ContentArea& area);

        const ConversionLog& log_;
        const std::vector<std::string> commands_{"Start", "Stop", "Clear log", "Exit"};
        int selected_index_ = 0;
        // Lines scrolled up from the newest entry.
        int log_offset_ = 0;
    };

    static void SlotGeometry(Slot slot,
                             unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols);

    KeyHints FocusHints() const;
    void CycleFocus(bool forward);
    void RunCommand(StateMachine& machine);
    void AddSelection();
    void AddAllInDirectory();
    void SetOutputFromSelection();
    void RemoveSelectedJob();
    void ClearJobs();
    void StartBatch();
    void StopBatch();
    std::size_t AddInputs(const std::vector<std::filesystem::path>& inputs);
    std::filesystem::path OutputDirectory() const;

    ConverterConfig& config_;
    bool& config_changed_;
    ConversionLog& log_;
    // Used for input filtering only; each batch gets a converter built from the current settings.
    OpusToMp3Converter input_filter_;
    JobQueue jobs_;
    BatchRunner runner_;
    Focus focus_ = Focus::Files;

    FileSubframe file_subframe_;
    QueueSubframe queue_subframe_;
    SettingsSubframe settings_subframe_;
    SummarySubframe summary_subframe_;
    CommandSubframe command_subframe_;
};

#endif // TUI_CONVERTERSCREEN_HPP
