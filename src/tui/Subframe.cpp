#include <algorithm>
#include <utility>

#include "tui/Subframe.hpp"

namespace {
constexpr unsigned kFocusR = 150;
constexpr unsigned kFocusG = 200;
constexpr unsigned kFocusB = 255;
} // namespace

std::string ClipLabel(const std::string& label, int width, int offset) {
    if (width <= 0) {
        return {};
    }
    const int max_offset = std::max(0, static_cast<int>(label.size()) - width);
    offset = std::clamp(offset, 0, max_offset);
    return label.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(width));
}

Subframe::Subframe(std::string title)
    : plane_(nullptr), cached_rows_(0), cached_cols_(0), title_(std::move(title)), focused_(false) {}

Subframe::~Subframe() = default;

void Subframe::Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols) {
    int y = 0;
    int x = 0;
    int rows = 0;
    int cols = 0;
    ComputeGeometry(parent_rows, parent_cols, y, x, rows, cols);

    if (rows <= 2 || cols <= 2) {
        Release();
        return;
    }

    if (plane_ == nullptr || cached_rows_ != static_cast<unsigned>(rows) || cached_cols_ != static_cast<unsigned>(cols)) {
        plane_ = std::make_unique<ncpp::Plane>(&parent, rows, cols, y, x);
        cached_rows_ = static_cast<unsigned>(rows);
        cached_cols_ = static_cast<unsigned>(cols);
    } else {
        plane_->move(y, x);
    }
}

void Subframe::Release() {
    plane_.reset();
    cached_rows_ = cached_cols_ = 0;
}

void Subframe::Draw() {
    if (plane_ == nullptr) {
        return;
    }
    plane_->erase();
    uint64_t channels = 0;
    if (focused_) {
        ncchannels_set_fg_rgb8(&channels, kFocusR, kFocusG, kFocusB);
        ncchannels_set_bg_default(&channels);
    }
    plane_->perimeter_rounded(0, channels, 0);
    if (!title_.empty()) {
        plane_->putstr(0, ncpp::NCAlign::Center, (" " + title_ + " ").c_str());
    }
    DrawContents();
    ResetColors();
}

bool Subframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)input;
    (void)details;
    return false;
}

Subframe::ContentArea Subframe::ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const {
    ContentArea area{0, 0, 0, 0};
    if (plane_ == nullptr) {
        return area;
    }

    const int total_rows = static_cast<int>(plane_->get_dim_y());
    const int total_cols = static_cast<int>(plane_->get_dim_x());

    area.top = std::max(0, pad_top);
    area.left = std::max(0, pad_left);
    area.height = std::max(0, total_rows - pad_top - pad_bottom);
    area.width = std::max(0, total_cols - pad_left - pad_right);
    return area;
}

void Subframe::DrawList(const ContentArea& area,
                        const std::vector<std::string>& labels,
                        int selected,
                        int& scroll_offset,
                        int horizontal_offset) {
    const int visible_rows = area.height;
    const int item_count = static_cast<int>(labels.size());
    if (visible_rows <= 0 || area.width <= 0) {
        return;
    }

    // Keep the selection on screen.
    if (selected >= 0) {
        if (selected < scroll_offset) {
            scroll_offset = selected;
        } else if (selected >= scroll_offset + visible_rows) {
            scroll_offset = selected - visible_rows + 1;
        }
    }
    scroll_offset = std::clamp(scroll_offset, 0, std::max(0, item_count - visible_rows));

    const int text_width = std::max(0, area.width - 1);
    for (int i = 0; i < visible_rows && (scroll_offset + i) < item_count; ++i) {
        const int item_index = scroll_offset + i;
        const int row = area.top + i;
        if (item_index == selected) {
            Highlight();
            for (int col = area.left - 1; col < area.left + text_width; ++col) {
                plane_->putstr(row, col, " ");
            }
        } else {
            ResetColors();
        }
        const int offset = item_index == selected ? horizontal_offset : 0;
        plane_->putstr(row, area.left, ClipLabel(labels[static_cast<std::size_t>(item_index)], text_width, offset).c_str());
    }
    ResetColors();

    if (item_count > visible_rows) {
        DrawScrollbar(area, item_count, scroll_offset);
    }
}

void Subframe::DrawScrollbar(const ContentArea& area, int item_count, int first_visible) {
    const int visible_rows = area.height;
    if (item_count <= visible_rows || visible_rows <= 0) {
        return;
    }
    const int bar_col = area.left + area.width - 1;
    const int thumb_height = std::max(1, (visible_rows * visible_rows) / item_count);
    const int max_thumb_start = visible_rows - thumb_height;
    const int thumb_start = (max_thumb_start * first_visible) / (item_count - visible_rows);
    plane_->set_bg_rgb8(200, 200, 200);
    plane_->set_fg_rgb8(0, 0, 0);
    for (int i = 0; i < thumb_height; ++i) {
        plane_->putstr(area.top + thumb_start + i, bar_col, " ");
    }
    ResetColors();
}

void Subframe::Highlight() {
    plane_->set_bg_rgb8(255, 255, 255);
    plane_->set_fg_rgb8(0, 0, 0);
}

void Subframe::ResetColors() {
    plane_->set_bg_default();
    plane_->set_fg_default();
}
