#include "tui/FileBrowser.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

FileBrowser::FileBrowser() : FileBrowser(FileFilter()) {}

FileBrowser::FileBrowser(FileFilter filter)
    : filter_(std::move(filter)),
      current_path_(std::filesystem::current_path()),
      selected_index_(0) {
    Refresh();
}

bool FileBrowser::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return false;
    }
    const std::filesystem::path previous = current_path_;
    current_path_ = std::filesystem::absolute(path, ec).lexically_normal();
    if (ec) {
        current_path_ = path;
    }
    // "dir/" normalizes with an empty filename; drop it so ".." really goes up.
    if (current_path_.filename().empty() && current_path_ != current_path_.root_path()) {
        current_path_ = current_path_.parent_path();
    }
    if (!Refresh()) {
        current_path_ = previous;
        Refresh();
        return false;
    }
    return true;
}

void FileBrowser::MoveSelectionUp() {
    if (entries_.empty()) {
        return;
    }
    if (selected_index_ == 0) {
        selected_index_ = entries_.size() - 1;
    } else {
        --selected_index_;
    }
}

void FileBrowser::MoveSelectionDown() {
    if (entries_.empty()) {
        return;
    }
    selected_index_ = (selected_index_ + 1) % entries_.size();
}

void FileBrowser::ActivateSelection() {
    if (entries_.empty()) {
        return;
    }

    const Entry& entry = entries_[selected_index_];
    if (entry.name == "..") {
        if (current_path_.has_parent_path() && current_path_ != current_path_.root_path()) {
            Load(current_path_.parent_path());
        }
        return;
    }

    if (!entry.is_dir) {
        return;
    }

    Load(current_path_ / entry.name);
}

const FileBrowser::Entry* FileBrowser::SelectedEntry() const {
    if (selected_index_ >= entries_.size()) {
        return nullptr;
    }
    return &entries_[selected_index_];
}

std::filesystem::path FileBrowser::SelectedPath() const {
    const Entry* entry = SelectedEntry();
    if (entry == nullptr || entry->name == "..") {
        return {};
    }
    return current_path_ / entry->name;
}

bool FileBrowser::Refresh() {
    entries_.clear();
    selected_index_ = 0;

    if (current_path_.has_parent_path() && current_path_ != current_path_.root_path()) {
        entries_.push_back(Entry{"..", true});
    }

    std::vector<Entry> dirs;
    std::vector<Entry> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(current_path_, ec);
    if (ec) {
        return false;
    }
    for (const std::filesystem::directory_entry& dirent : it) {
        const std::string name = dirent.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (dirent.is_directory(ec)) {
            dirs.push_back(Entry{name, true});
        } else if (!filter_ || filter_(dirent.path())) {
            files.push_back(Entry{name, false});
        }
    }

    auto sorter = [](const Entry& a, const Entry& b) {
        return a.name < b.name;
    };
    std::sort(dirs.begin(), dirs.end(), sorter);
    std::sort(files.begin(), files.end(), sorter);

    entries_.insert(entries_.end(), dirs.begin(), dirs.end());
    entries_.insert(entries_.end(), files.begin(), files.end());
    return true;
}
