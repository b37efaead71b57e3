#include "tui/ConverterScreen.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

#include <notcurses/notcurses.h>

#include "converter/MediaProbe.hpp"
#include "converter/Process.hpp"
#include "tui/StateMachine.hpp"

namespace {
constexpr int kMargin = 1;
constexpr int kGap = 1;
constexpr int kFooterRows = 10;
constexpr unsigned kMinimumRows = 22;
constexpr unsigned kMinimumCols = 60;

bool IsEnter(uint32_t input) {
    return input == NCKEY_ENTER || input == '\n' || input == '\r';
}

bool IsBackspace(uint32_t input) {
    return input == NCKEY_BACKSPACE || input == 127 || input == 8;
}

// Pasted paths often arrive quoted.
std::string NormalizePath(const std::string& raw) {
    std::string trimmed = raw;
    while (!trimmed.empty() && (trimmed.front() == '\"' || trimmed.front() == '\'' || trimmed.front() == ' ')) {
        trimmed.erase(trimmed.begin());
    }
    while (!trimmed.empty() && (trimmed.back() == '\"' || trimmed.back() == '\'' || trimmed.back() == ' ')) {
        trimmed.pop_back();
    }
    return trimmed;
}

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void PopUtf8(std::string& text) {
    while (!text.empty()) {
        const unsigned char last = static_cast<unsigned char>(text.back());
        text.pop_back();
        if ((last & 0xC0) != 0x80) {
            break;
        }
    }
}

std::string Plural(std::size_t count, const char* noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

void ComputeLayout(unsigned parent_rows, int& top_rows, int& mid_rows, int& footer_y) {
    int avail = static_cast<int>(parent_rows) - (kMargin * 2) - (kGap * 2) - kFooterRows;
    if (avail < 8) {
        avail = 8;
    }
    top_rows = std::max(4, (avail * 3) / 5);
    mid_rows = std::max(4, avail - top_rows);
    footer_y = kMargin + top_rows + kGap + mid_rows + kGap;
}
} // namespace

ConverterScreen::ConverterScreen(ConverterConfig& config, bool& config_changed, ConversionLog& log)
    : config_(config),
      config_changed_(config_changed),
      log_(log),
      input_filter_(SettingsFromConfig(config)),
      jobs_(),
      runner_(jobs_, log_, [this]() -> std::unique_ptr<AudioConverter> {
          return std::make_unique<OpusToMp3Converter>(SettingsFromConfig(config_));
      }),
      file_subframe_(input_filter_),
      queue_subframe_(jobs_, runner_),
      settings_subframe_(config_, config_changed_),
      summary_subframe_(config_, jobs_, runner_),
      command_subframe_(log_) {}

ConverterScreen::~ConverterScreen() {
    runner_.Stop();
}

void ConverterScreen::Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    const std::string input_folder = config_.GetString("input_folder", "");
    if (input_folder.empty() || !file_subframe_.Open(input_folder)) {
        file_subframe_.RefreshListing();
    }
    summary_subframe_.Refresh();
}

void ConverterScreen::Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    if (runner_.IsRunning()) {
        runner_.Stop();
    }
}

void ConverterScreen::Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    Subframe* panes[] = {&file_subframe_, &queue_subframe_, &settings_subframe_, &summary_subframe_, &command_subframe_};
    if (!CheckMinimumSize(stdplane, ScreenSize{kMinimumRows, kMinimumCols})) {
        for (Subframe* pane : panes) {
            pane->Release();
        }
        return;
    }

    DrawFrame(stdplane, "Opus to MP3 Converter");
    DrawKeyHints(stdplane, FocusHints());

    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);

    file_subframe_.SetFocused(focus_ == Focus::Files);
    queue_subframe_.SetFocused(focus_ == Focus::Queue);
    settings_subframe_.SetFocused(focus_ == Focus::Settings);
    summary_subframe_.SetFocused(focus_ == Focus::Summary);
    command_subframe_.SetFocused(focus_ == Focus::Commands);

    for (Subframe* pane : panes) {
        pane->Resize(stdplane, rows, cols);
        pane->Draw();
    }
}

BaseScreen::KeyHints ConverterScreen::FocusHints() const {
    KeyHints hints{{"Tab", "next pane"}};
    switch (focus_) {
    case Focus::Files:
        hints.insert(hints.end(), {{"Enter", "open"}, {"s", "add"}, {"a", "add all"}, {"o", "output dir"}});
        break;
    case Focus::Queue:
        hints.insert(hints.end(), {{"d", "remove"}, {"c", "clear"}});
        break;
    case Focus::Settings:
        if (settings_subframe_.Editing()) {
            return KeyHints{{"Enter", "save"}, {"Esc", "cancel"}};
        }
        hints.insert(hints.end(), {{"Enter", "edit"}, {"Backspace", "back"}});
        break;
    case Focus::Summary:
        break;
    case Focus::Commands:
        hints.insert(hints.end(), {{"Left/Right", "command"}, {"Enter", "run"}, {"Up/Down", "scroll log"}});
        break;
    }
    hints.emplace_back("Q", "quit");
    return hints;
}

void ConverterScreen::Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    summary_subframe_.Refresh();
}

bool ConverterScreen::HandleInput(StateMachine& machine,
                                  ncpp::NotCurses& nc,
                                  ncpp::Plane& stdplane,
                                  uint32_t input,
                                  const ncinput& details) {
    (void)nc;
    (void)stdplane;

    if (focus_ == Focus::Settings && settings_subframe_.Editing()) {
        settings_subframe_.HandleInput(input, details);
        return true;
    }

    if (input == '\t') {
        CycleFocus(!ncinput_shift_p(&details));
        return true;
    }

    switch (focus_) {
    case Focus::Files:
        if (input == 's' || input == ' ') {
            AddSelection();
            return true;
        }
        if (input == 'a') {
            AddAllInDirectory();
            return true;
        }
        if (input == 'o') {
            SetOutputFromSelection();
            return true;
        }
        if (IsEnter(input)) {
            const FileBrowser::Entry* entry = file_subframe_.SelectedEntry();
            if (entry != nullptr && !entry->is_dir) {
                AddSelection();
                return true;
            }
        }
        return file_subframe_.HandleInput(input, details);
    case Focus::Queue:
        if (input == 'd' || input == NCKEY_DEL) {
            RemoveSelectedJob();
            return true;
        }
        if (input == 'c') {
            ClearJobs();
            return true;
        }
        return queue_subframe_.HandleInput(input, details);
    case Focus::Settings:
        return settings_subframe_.HandleInput(input, details);
    case Focus::Summary:
        return summary_subframe_.HandleInput(input, details);
    case Focus::Commands:
        if (IsEnter(input)) {
            RunCommand(machine);
            return true;
        }
        return command_subframe_.HandleInput(input, details);
    }
    return false;
}

void ConverterScreen::CycleFocus(bool forward) {
    static const Focus order[] = {Focus::Files, Focus::Queue, Focus::Settings, Focus::Summary, Focus::Commands};
    constexpr int count = static_cast<int>(sizeof(order) / sizeof(order[0]));
    int index = 0;
    for (int i = 0; i < count; ++i) {
        if (order[i] == focus_) {
            index = i;
        }
    }
    index = forward ? (index + 1) % count : (index - 1 + count) % count;
    focus_ = order[index];
}

void ConverterScreen::RunCommand(StateMachine& machine) {
    const std::string& command = command_subframe_.SelectedCommand();
    if (command == "Start") {
        StartBatch();
    } else if (command == "Stop") {
        StopBatch();
    } else if (command == "Clear log") {
        log_.Clear();
        command_subframe_.ScrollToEnd();
    } else if (command == "Exit") {
        if (runner_.IsRunning()) {
            runner_.Stop();
        }
        machine.RequestStop();
    }
}

std::size_t ConverterScreen::AddInputs(const std::vector<std::filesystem::path>& inputs) {
    std::size_t added = 0;
    std::size_t duplicates = 0;
    for (const std::filesystem::path& input : inputs) {
        if (jobs_.Contains(input)) {
            ++duplicates;
            continue;
        }
        if (const std::optional<std::filesystem::path> other = jobs_.OutputConflict(input)) {
            log_.Append(LogType::Warning, "Skipping " + input.string() + ": " +
                                              input_filter_.OutputPathFor(input, {}).filename().string() +
                                              " would overwrite the output of " + other->string() + ".");
            continue;
        }
        if (jobs_.Add(input, DurationLabel(input))) {
            ++added;
        } else {
            ++duplicates;
        }
    }
    if (added > 0) {
        log_.Append(LogType::Info, "Added " + Plural(added, "file") + " to the queue.");
    }
    if (duplicates > 0) {
        log_.Append(LogType::Warning, Plural(duplicates, "file") + " already in the queue.");
    }
    return added;
}

void ConverterScreen::AddSelection() {
    const FileBrowser::Entry* entry = file_subframe_.SelectedEntry();
    if (entry == nullptr || entry->name == "..") {
        return;
    }
    const std::filesystem::path selected = file_subframe_.SelectedPath();
    if (entry->is_dir) {
        const std::vector<std::filesystem::path> inputs = input_filter_.CollectInputs(selected);
        if (inputs.empty()) {
            log_.Append(LogType::Warning, "No Opus files found in " + selected.string() + ".");
            return;
        }
        AddInputs(inputs);
        return;
    }
    if (!input_filter_.AcceptsInput(selected)) {
        log_.Append(LogType::Warning, "Skipping " + selected.filename().string() + ": not an Opus file.");
        return;
    }
    AddInputs({selected});
}

void ConverterScreen::AddAllInDirectory() {
    const std::filesystem::path dir = file_subframe_.CurrentPath();
    const std::vector<std::filesystem::path> inputs = input_filter_.CollectInputs(dir);
    log_.Append(LogType::Info, "Found " + std::to_string(inputs.size()) + " Opus files in source folder.");
    AddInputs(inputs);

    if (config_.GetString("input_folder", "") != dir.string()) {
        config_.SetString("input_folder", dir.string());
        config_changed_ = true;
    }
}

void ConverterScreen::SetOutputFromSelection() {
    std::filesystem::path dir = file_subframe_.CurrentPath();
    const FileBrowser::Entry* entry = file_subframe_.SelectedEntry();
    if (entry != nullptr && entry->is_dir && entry->name != "..") {
        dir = file_subframe_.SelectedPath();
    }

    if (config_.GetString("output_folder", "") != dir.string()) {
        config_.SetString("output_folder", dir.string());
        config_changed_ = true;
    }
    log_.Append(LogType::Info, "Destination directory: " + dir.string());

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        log_.Append(LogType::Error, "Destination directory not found: " + dir.string());
        return;
    }
    std::size_t mp3_count = 0;
    for (const std::filesystem::directory_entry& dirent : it) {
        const std::string name = dirent.path().filename().string();
        if (!name.empty() && name[0] != '.' && dirent.path().extension() == ".mp3" && dirent.is_regular_file(ec)) {
            ++mp3_count;
        }
    }
    log_.Append(LogType::Info, "Found " + std::to_string(mp3_count) + " MP3 files in destination folder.");
}

void ConverterScreen::RemoveSelectedJob() {
    if (runner_.IsRunning()) {
        log_.Append(LogType::Warning, "Cannot remove files while a conversion is running.");
        return;
    }
    const std::optional<std::uint64_t> id = queue_subframe_.SelectedJobId();
    if (!id) {
        return;
    }
    const std::optional<Job> job = jobs_.Get(*id);
    if (job && jobs_.Remove(*id)) {
        log_.Append(LogType::Info, "Removed " + job->input_path.filename().string() + " from the queue.");
    }
}

void ConverterScreen::ClearJobs() {
    if (runner_.IsRunning()) {
        log_.Append(LogType::Warning, "Cannot clear the queue while a conversion is running.");
        return;
    }
    if (jobs_.Clear()) {
        log_.Append(LogType::Info, "Queue cleared.");
    }
}

void ConverterScreen::StartBatch() {
    if (runner_.Start(OutputDirectory())) {
        command_subframe_.ScrollToEnd();
    }
}

void ConverterScreen::StopBatch() {
    if (!runner_.IsRunning()) {
        log_.Append(LogType::Info, "No conversion is running.");
        return;
    }
    runner_.Stop();
}

std::filesystem::path ConverterScreen::OutputDirectory() const {
    return std::filesystem::path(config_.GetString("output_folder", ""));
}

void ConverterScreen::SlotGeometry(Slot slot,
                                   unsigned parent_rows,
                                   unsigned parent_cols,
                                   int& y,
                                   int& x,
                                   int& rows,
                                   int& cols) {
    int top_rows = 0;
    int mid_rows = 0;
    int footer_y = 0;
    ComputeLayout(parent_rows, top_rows, mid_rows, footer_y);

    const int inner_width = static_cast<int>(parent_cols) - (kMargin * 2);
    const int left_cols = std::max(20, (inner_width - kGap) / 2);
    const int right_x = kMargin + left_cols + kGap;
    const int right_cols = std::max(20, inner_width - left_cols - kGap);

    switch (slot) {
    case Slot::TopLeft:
        y = kMargin;
        x = kMargin;
        rows = top_rows;
        cols = left_cols;
        break;
    case Slot::TopRight:
        y = kMargin;
        x = right_x;
        rows = top_rows;
        cols = right_cols;
        break;
    case Slot::MidLeft:
        y = kMargin + top_rows + kGap;
        x = kMargin;
        rows = mid_rows;
        cols = left_cols;
        break;
    case Slot::MidRight:
        y = kMargin + top_rows + kGap;
        x = right_x;
        rows = mid_rows;
        cols = right_cols;
        break;
    case Slot::Footer:
        y = footer_y;
        x = kMargin;
        // Stop short of the outer border on the last row.
        rows = std::max(4, static_cast<int>(parent_rows) - 1 - footer_y);
        cols = std::max(20, inner_width);
        break;
    }
}

ConverterScreen::Pane::Pane(std::string title, Slot slot) : Subframe(std::move(title)), slot_(slot) {}

void ConverterScreen::Pane::ComputeGeometry(unsigned parent_rows,
                                            unsigned parent_cols,
                                            int& y,
                                            int& x,
                                            int& rows,
                                            int& cols) {
    SlotGeometry(slot_, parent_rows, parent_cols, y, x, rows, cols);
}

// File browser

ConverterScreen::FileSubframe::FileSubframe(const AudioConverter& converter)
    : Pane("Source files", Slot::TopLeft),
      browser_([&converter](const std::filesystem::path& path) { return converter.AcceptsInput(path); }) {}

bool ConverterScreen::FileSubframe::Open(const std::filesystem::path& dir) {
    scroll_offset_ = 0;
    horizontal_offset_ = 0;
    return browser_.Load(dir);
}

void ConverterScreen::FileSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (area.height <= 0) {
        return;
    }
    // Current directory on the first row, entries below.
    plane_->set_fg_rgb8(150, 150, 150);
    plane_->putstr(area.top, area.left, ClipLabel(browser_.CurrentPath().string(), area.width,
                                                  static_cast<int>(browser_.CurrentPath().string().size())).c_str());
    ResetColors();

    std::vector<std::string> labels;
    labels.reserve(browser_.Entries().size());
    for (const FileBrowser::Entry& entry : browser_.Entries()) {
        labels.push_back(entry.is_dir && entry.name != ".." ? entry.name + "/" : entry.name);
    }
    if (labels.empty()) {
        plane_->putstr(area.top + 1, area.left, "(no Opus files)");
        return;
    }
    const ContentArea list{area.top + 1, area.left, area.height - 1, area.width};
    DrawList(list, labels, static_cast<int>(browser_.SelectedIndex()), scroll_offset_, horizontal_offset_);
}

bool ConverterScreen::FileSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    if (input == NCKEY_UP) {
        browser_.MoveSelectionUp();
        horizontal_offset_ = 0;
    } else if (input == NCKEY_DOWN) {
        browser_.MoveSelectionDown();
        horizontal_offset_ = 0;
    } else if (IsEnter(input)) {
        browser_.ActivateSelection();
        scroll_offset_ = 0;
        horizontal_offset_ = 0;
    } else if (IsBackspace(input)) {
        Open(browser_.CurrentPath().parent_path());
    } else if (input == NCKEY_RIGHT) {
        const FileBrowser::Entry* entry = browser_.SelectedEntry();
        const int width = std::max(0, ContentBox(1, 2, 1, 2).width - 1);
        if (entry != nullptr && horizontal_offset_ < static_cast<int>(entry->name.size()) + 1 - width) {
            ++horizontal_offset_;
        }
    } else if (input == NCKEY_LEFT) {
        if (horizontal_offset_ > 0) {
            --horizontal_offset_;
        }
    } else {
        return false;
    }
    return true;
}

// Queue

ConverterScreen::QueueSubframe::QueueSubframe(const JobQueue& jobs, const BatchRunner& runner)
    : Pane("Queue", Slot::TopRight), jobs_(jobs), runner_(runner) {}

std::string ConverterScreen::QueueSubframe::JobLabel(const Job& job, const BatchProgress& progress) {
    std::string status = JobStatusName(job.status);
    if (job.status == JobStatus::Running) {
        const int percent = static_cast<int>(std::lround(std::clamp(progress.current_fraction, 0.0, 1.0) * 100.0));
        status += " " + std::to_string(percent) + "%";
    }
    std::string label = "[" + status + "] " + job.input_path.filename().string() + "  " + job.duration_label;
    if (!job.error.empty()) {
        label += "  " + job.error;
    }
    return label;
}

void ConverterScreen::QueueSubframe::DrawProgressBar(const ContentArea& area, const BatchProgress& progress) {
    const std::string counter = " " + std::to_string(progress.completed) + "/" + std::to_string(progress.total);
    const int bar_width = std::max(1, area.width - 1 - static_cast<int>(counter.size()));

    double fraction = 0.0;
    if (progress.total > 0) {
        double done = static_cast<double>(progress.completed);
        if (progress.running) {
            done += std::clamp(progress.current_fraction, 0.0, 1.0);
        }
        fraction = std::min(1.0, done / static_cast<double>(progress.total));
    }
    const int filled = std::min(bar_width, static_cast<int>(fraction * bar_width));

    plane_->set_bg_rgb8(60, 60, 60);
    for (int col = 0; col < bar_width; ++col) {
        plane_->putstr(area.top, area.left + col, " ");
    }
    Highlight();
    for (int col = 0; col < filled; ++col) {
        plane_->putstr(area.top, area.left + col, " ");
    }
    ResetColors();
    plane_->putstr(area.top, area.left + bar_width, counter.c_str());
}

void ConverterScreen::QueueSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (area.height <= 0) {
        return;
    }
    const BatchProgress progress = runner_.Progress();
    DrawProgressBar(area, progress);

    const std::vector<Job> jobs = jobs_.Snapshot();
    if (jobs.empty()) {
        selected_index_ = 0;
        scroll_offset_ = 0;
        if (area.height > 2) {
            plane_->putstr(area.top + 2, area.left, "Empty. Select files and press s.");
        }
        return;
    }
    selected_index_ = std::clamp(selected_index_, 0, static_cast<int>(jobs.size()) - 1);

    std::vector<std::string> labels;
    labels.reserve(jobs.size());
    for (const Job& job : jobs) {
        labels.push_back(JobLabel(job, progress));
    }
    const ContentArea list{area.top + 2, area.left, area.height - 2, area.width};
    DrawList(list, labels, selected_index_, scroll_offset_, horizontal_offset_);
}

bool ConverterScreen::QueueSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    const int count = static_cast<int>(jobs_.Size());
    if (input == NCKEY_UP) {
        if (count > 0) {
            selected_index_ = (selected_index_ - 1 + count) % count;
        }
        horizontal_offset_ = 0;
    } else if (input == NCKEY_DOWN) {
        if (count > 0) {
            selected_index_ = (selected_index_ + 1) % count;
        }
        horizontal_offset_ = 0;
    } else if (input == NCKEY_RIGHT) {
        ++horizontal_offset_;
    } else if (input == NCKEY_LEFT) {
        if (horizontal_offset_ > 0) {
            --horizontal_offset_;
        }
    } else {
        return false;
    }
    return true;
}

std::optional<std::uint64_t> ConverterScreen::QueueSubframe::SelectedJobId() const {
    const std::vector<Job> jobs = jobs_.Snapshot();
    if (selected_index_ < 0 || selected_index_ >= static_cast<int>(jobs.size())) {
        return std::nullopt;
    }
    return jobs[static_cast<std::size_t>(selected_index_)].id;
}

// Settings

ConverterScreen::SettingsSubframe::SettingsSubframe(ConverterConfig& config, bool& config_changed)
    : Pane("Settings", Slot::MidLeft), config_(config), config_changed_(config_changed) {}

void ConverterScreen::SettingsSubframe::EnterOptions() {
    mode_ = Mode::Options;
    option_index_ = 0;
    scroll_offset_ = 0;
    current_options_.clear();

    using Type = Option::Type;
    switch (submenu_index_) {
    case 0:
        current_options_.push_back(Option{"input_folder", "Input folder", Type::String, ""});
        current_options_.push_back(Option{"output_folder", "Output folder", Type::String, ""});
        current_options_.push_back(Option{"ffmpeg_path", "ffmpeg executable", Type::String, "ffmpeg"});
        current_options_.push_back(Option{"log_file", "Log file", Type::String, ""});
        break;
    case 1:
        current_options_.push_back(Option{"mp3_quality", "VBR quality (0 best)", Type::Int, "0", 0, 9});
        current_options_.push_back(Option{"mp3_use_cbr", "Use CBR", Type::Bool, "false"});
        current_options_.push_back(Option{"mp3_bitrate_kbps", "CBR bitrate kbps", Type::Int, "320", 8, 320});
        current_options_.push_back(Option{"sample_rate", "Sample rate Hz", Type::Int, "48000", 8000, 48000});
        break;
    case 2:
        current_options_.push_back(Option{"loudnorm_enabled", "Normalize loudness", Type::Bool, "true"});
        current_options_.push_back(Option{"loudnorm_i", "Integrated LUFS", Type::Double, "-12", -70, -5});
        current_options_.push_back(Option{"loudnorm_lra", "Loudness range LU", Type::Double, "11", 1, 50});
        current_options_.push_back(Option{"loudnorm_tp", "True peak dBTP", Type::Double, "-1.5", -9, 0});
        break;
    default:
        current_options_.push_back(Option{"copy_tags", "Copy tags", Type::Bool, "true"});
        current_options_.push_back(Option{"copy_cover_art", "Copy cover art", Type::Bool, "true"});
        break;
    }
}

void ConverterScreen::SettingsSubframe::EnterSubmenus() {
    mode_ = Mode::Submenus;
    option_index_ = 0;
    scroll_offset_ = 0;
    edit_buffer_.clear();
    edit_error_.clear();
}

const ConverterScreen::SettingsSubframe::Option* ConverterScreen::SettingsSubframe::SelectedOption() const {
    // Row 0 is "(Back)".
    if (option_index_ <= 0 || option_index_ > static_cast<int>(current_options_.size())) {
        return nullptr;
    }
    return &current_options_[static_cast<std::size_t>(option_index_ - 1)];
}

std::string ConverterScreen::SettingsSubframe::ValueText(const Option& option) const {
    switch (option.type) {
    case Option::Type::Bool:
        return config_.GetBool(option.key, option.fallback == "true") ? "yes" : "no";
    case Option::Type::Int:
        return std::to_string(config_.GetInt(option.key, std::stoi(option.fallback)));
    case Option::Type::Double:
        return FormatConfigNumber(config_.GetDouble(option.key, ParseConfigNumber(option.fallback).value_or(0.0)));
    case Option::Type::String: {
        const std::string value = config_.GetString(option.key, option.fallback);
        return value.empty() ? "(not set)" : value;
    }
    }
    return {};
}

void ConverterScreen::SettingsSubframe::DrawContents() {
    // Bottom padding leaves a row for the edit line.
    const ContentArea area = ContentBox(1, 2, 2, 2);

    std::vector<std::string> labels;
    int selected = 0;
    if (mode_ == Mode::Submenus) {
        labels = submenu_titles_;
        selected = submenu_index_;
    } else {
        labels.push_back("(Back)");
        for (const Option& option : current_options_) {
            labels.push_back(option.label + ": " + ValueText(option));
        }
        selected = option_index_;
    }
    DrawList(area, labels, selected, scroll_offset_);
    DrawEditLine(area);
}

void ConverterScreen::SettingsSubframe::DrawEditLine(const ContentArea& area) {
    const int row = area.top + area.height;
    std::string line;
    if (mode_ == Mode::EditBool) {
        line = bool_choice_ ? "Set: [yes] no" : "Set: yes [no]";
    } else if (mode_ == Mode::EditValue) {
        line = "Set: " + edit_buffer_ + "_";
    } else if (!edit_error_.empty()) {
        plane_->set_fg_rgb(LogTypeColor(LogType::Error));
        line = edit_error_;
    } else {
        return;
    }
    // Keep the cursor end of a long value visible.
    plane_->putstr(row, area.left, ClipLabel(line, area.width, static_cast<int>(line.size())).c_str());
    ResetColors();
}

void ConverterScreen::SettingsSubframe::BeginEdit(const Option& option) {
    edit_error_.clear();
    if (option.type == Option::Type::Bool) {
        mode_ = Mode::EditBool;
        bool_choice_ = config_.GetBool(option.key, option.fallback == "true");
        return;
    }
    mode_ = Mode::EditValue;
    edit_buffer_ = config_.GetString(option.key, option.fallback);
}

void ConverterScreen::SettingsSubframe::CommitBool() {
    const Option* option = SelectedOption();
    if (option != nullptr) {
        config_.SetBool(option->key, bool_choice_);
        config_changed_ = true;
    }
    mode_ = Mode::Options;
}

void ConverterScreen::SettingsSubframe::CommitValue() {
    const Option* option = SelectedOption();
    mode_ = Mode::Options;
    if (option == nullptr) {
        return;
    }
    const std::string text = edit_buffer_;
    edit_buffer_.clear();

    if (option->type == Option::Type::String) {
        config_.SetString(option->key, NormalizePath(text));
        config_changed_ = true;
        return;
    }
    if (text.empty()) {
        return;
    }

    double value = 0.0;
    if (option->type == Option::Type::Int) {
        try {
            std::size_t consumed = 0;
            value = static_cast<double>(std::stoi(text, &consumed));
            if (consumed != text.size()) {
                edit_error_ = "Not a number: " + text;
                return;
            }
        } catch (const std::exception&) {
            edit_error_ = "Not a number: " + text;
            return;
        }
    } else {
        const std::optional<double> parsed = ParseConfigNumber(text);
        if (!parsed) {
            edit_error_ = "Not a number: " + text;
            return;
        }
        value = *parsed;
    }
    if (option->min < option->max && (value < option->min || value > option->max)) {
        edit_error_ = option->label + " must be between " + FormatConfigNumber(option->min) + " and " +
                      FormatConfigNumber(option->max) + ".";
        return;
    }
    if (option->type == Option::Type::Int) {
        config_.SetInt(option->key, static_cast<int>(value));
    } else {
        config_.SetDouble(option->key, value);
    }
    config_changed_ = true;
}

bool ConverterScreen::SettingsSubframe::AcceptsChar(const Option& option, uint32_t input) const {
    if (nckey_synthesized_p(input) || input < 32 || input == 127) {
        return false;
    }
    switch (option.type) {
    case Option::Type::Int:
        return input >= '0' && input <= '9';
    case Option::Type::Double:
        return (input >= '0' && input <= '9') || input == '-' || input == '.';
    case Option::Type::Bool:
        return false;
    case Option::Type::String:
        return true;
    }
    return false;
}

bool ConverterScreen::SettingsSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;

    switch (mode_) {
    case Mode::Submenus: {
        const int total = static_cast<int>(submenu_titles_.size());
        if (input == NCKEY_UP) {
            submenu_index_ = (submenu_index_ - 1 + total) % total;
        } else if (input == NCKEY_DOWN) {
            submenu_index_ = (submenu_index_ + 1) % total;
        } else if (IsEnter(input) || input == NCKEY_RIGHT) {
            EnterOptions();
        } else {
            return false;
        }
        return true;
    }
    case Mode::Options: {
        const int total = static_cast<int>(current_options_.size()) + 1;
        if (input == NCKEY_UP) {
            option_index_ = (option_index_ - 1 + total) % total;
            edit_error_.clear();
        } else if (input == NCKEY_DOWN) {
            option_index_ = (option_index_ + 1) % total;
            edit_error_.clear();
        } else if (input == NCKEY_LEFT || IsBackspace(input)) {
            EnterSubmenus();
        } else if (IsEnter(input)) {
            const Option* option = SelectedOption();
            if (option == nullptr) {
                EnterSubmenus();
            } else {
                BeginEdit(*option);
            }
        } else {
            return false;
        }
        return true;
    }
    case Mode::EditBool:
        if (input == NCKEY_LEFT || input == NCKEY_RIGHT || input == ' ') {
            bool_choice_ = !bool_choice_;
        } else if (IsEnter(input)) {
            CommitBool();
        } else if (input == NCKEY_ESC) {
            mode_ = Mode::Options;
        }
        return true;
    case Mode::EditValue: {
        const Option* option = SelectedOption();
        if (IsEnter(input)) {
            CommitValue();
        } else if (input == NCKEY_ESC) {
            edit_buffer_.clear();
            mode_ = Mode::Options;
        } else if (IsBackspace(input)) {
            PopUtf8(edit_buffer_);
        } else if (option != nullptr && AcceptsChar(*option, input)) {
            AppendUtf8(edit_buffer_, input);
        }
        return true;
    }
    }
    return false;
}

// Summary

ConverterScreen::SummarySubframe::SummarySubframe(const ConverterConfig& config,
                                                  const JobQueue& jobs,
                                                  const BatchRunner& runner)
    : Pane("Summary", Slot::MidRight), config_(config), jobs_(jobs), runner_(runner) {}

void ConverterScreen::SummarySubframe::Refresh() {
    const std::string configured = config_.GetString("ffmpeg_path", "ffmpeg");
    if (resolved_ && configured == resolved_for_) {
        return;
    }
    resolved_for_ = configured;
    ffmpeg_location_ = FindExecutable(configured.empty() ? "ffmpeg" : configured);
    resolved_ = true;
}

void ConverterScreen::SummarySubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const ConversionSettings settings = SettingsFromConfig(config_);
    const JobCounts counts = jobs_.Counts();
    const BatchProgress progress = runner_.Progress();

    const std::string output = config_.GetString("output_folder", "");
    std::string encoder = settings.use_cbr ? "CBR " + std::to_string(settings.mp3_bitrate_kbps) + " kbps"
                                           : "VBR quality " + std::to_string(settings.mp3_quality);
    encoder += ", " + std::to_string(settings.sample_rate) + " Hz";
    const std::string loudness = settings.loudnorm_enabled
        ? "I " + FormatConfigNumber(settings.loudnorm.integrated) + ", LRA " + FormatConfigNumber(settings.loudnorm.range) +
              ", TP " + FormatConfigNumber(settings.loudnorm.true_peak)
        : "off";

    std::string status = "idle";
    if (progress.running) {
        status = "converting";
        if (!progress.current_file.empty()) {
            const int percent = static_cast<int>(std::lround(std::clamp(progress.current_fraction, 0.0, 1.0) * 100.0));
            status += " " + progress.current_file + " " + std::to_string(percent) + "%";
        }
    }

    const std::vector<std::pair<std::string, std::string>> rows{
        {"Output", output.empty() ? "(not set)" : output},
        {"ffmpeg", ffmpeg_location_.empty() ? "not found" : ffmpeg_location_},
        {"Encoder", encoder},
        {"Loudness", loudness},
        {"Jobs", std::to_string(counts.queued) + " queued, " + std::to_string(counts.running) + " running, " +
                     std::to_string(counts.succeeded) + " done, " + std::to_string(counts.failed) + " failed, " +
                     std::to_string(counts.skipped) + " skipped"},
        {"Status", status},
    };

    for (int i = 0; i < area.height && i < static_cast<int>(rows.size()); ++i) {
        const auto& row = rows[static_cast<std::size_t>(i)];
        if (row.first == "ffmpeg" && ffmpeg_location_.empty()) {
            plane_->set_fg_rgb(LogTypeColor(LogType::Error));
        }
        const std::string line = row.first + ": " + row.second;
        plane_->putstr(area.top + i, area.left, ClipLabel(line, area.width).c_str());
        ResetColors();
    }
}

// Commands and log

ConverterScreen::CommandSubframe::CommandSubframe(const ConversionLog& log)
    : Pane("Commands", Slot::Footer), log_(log) {}

void ConverterScreen::CommandSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (area.height <= 0) {
        return;
    }
    // Log above, commands on the bottom line.
    DrawLog(ContentArea{area.top, area.left, area.height - 1, area.width});
    DrawCommands(area);
}

void ConverterScreen::CommandSubframe::DrawLog(const ContentArea& area) {
    const std::vector<LogEntry> entries = log_.Entries();
    const int total = static_cast<int>(entries.size());
    const int visible = area.height;
    if (visible <= 0) {
        return;
    }
    const int lines_to_show = std::min(visible, total);
    const int max_offset = std::max(0, total - lines_to_show);
    log_offset_ = std::clamp(log_offset_, 0, max_offset);
    const int first = std::max(0, total - lines_to_show - log_offset_);

    const int text_width = std::max(0, area.width - 1);
    for (int i = 0; i < lines_to_show; ++i) {
        const LogEntry& entry = entries[static_cast<std::size_t>(first + i)];
        // INFO's dark grey is unreadable on most terminal backgrounds.
        if (entry.type != LogType::Info) {
            plane_->set_fg_rgb(LogTypeColor(entry.type));
        }
        const std::string line = std::string(LogTypeName(entry.type)) + ": " + entry.message;
        plane_->putstr(area.top + i, area.left, ClipLabel(line, text_width).c_str());
        ResetColors();
    }

    DrawScrollbar(area, total, first);
}

void ConverterScreen::CommandSubframe::DrawCommands(const ContentArea& area) {
    const int row = area.top + area.height - 1;
    int col = area.left;
    for (int i = 0; i < static_cast<int>(commands_.size()); ++i) {
        if (i == selected_index_) {
            Highlight();
        } else {
            ResetColors();
        }
        const std::string& command = commands_[static_cast<std::size_t>(i)];
        plane_->putstr(row, col, command.c_str());
        col += static_cast<int>(command.size()) + 4;
    }
    ResetColors();
}

bool ConverterScreen::CommandSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    const int count = static_cast<int>(commands_.size());
    if (input == NCKEY_LEFT) {
        selected_index_ = (selected_index_ - 1 + count) % count;
    } else if (input == NCKEY_RIGHT) {
        selected_index_ = (selected_index_ + 1) % count;
    } else if (input == NCKEY_UP || input == NCKEY_BUTTON4) {
        ++log_offset_;
    } else if (input == NCKEY_DOWN || input == NCKEY_BUTTON5) {
        if (log_offset_ > 0) {
            --log_offset_;
        }
    } else if (input == NCKEY_PGUP) {
        log_offset_ += 5;
    } else if (input == NCKEY_PGDOWN) {
        log_offset_ = std::max(0, log_offset_ - 5);
    } else if (input == NCKEY_END) {
        log_offset_ = 0;
    } else {
        return false;
    }
    return true;
}
