#include "tui/BaseScreen.hpp"

#include <string>

void BaseScreen::DrawFrame(ncpp::Plane& plane, const std::string& title) {
    plane.erase();
    plane.perimeter_rounded(0, 0, 0);
    if (!title.empty()) {
        plane.putstr(0, ncpp::NCAlign::Center, (" " + title + " ").c_str());
    }
}

void BaseScreen::CenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines) {
    unsigned rows = 0;
    unsigned cols = 0;
    plane.get_dim(rows, cols);

    const int total_lines = static_cast<int>(lines.size());
    const int first_row = static_cast<int>(rows) / 2 - total_lines / 2;
    for (int index = 0; index < total_lines; ++index) {
        PutCentered(plane, first_row + index, lines[static_cast<std::size_t>(index)]);
    }
}

void BaseScreen::PutCentered(ncpp::Plane& plane, int row, const std::string& text) {
    plane.putstr(row, ncpp::NCAlign::Center, text.c_str());
}

void BaseScreen::DrawKeyHints(ncpp::Plane& plane, const KeyHints& hints) {
    unsigned rows = 0;
    unsigned cols = 0;
    plane.get_dim(rows, cols);
    if (rows == 0 || cols < 6) {
        return;
    }

    // Two columns for the corners, two for the padding spaces.
    const std::size_t width = cols - 4;
    std::string line;
    for (const auto& hint : hints) {
        const std::string item = hint.first + ": " + hint.second;
        const std::size_t needed = line.empty() ? item.size() : line.size() + 2 + item.size();
        if (needed > width) {
            break;
        }
        if (!line.empty()) {
            line += "  ";
        }
        line += item;
    }
    if (!line.empty()) {
        PutCentered(plane, static_cast<int>(rows) - 1, " " + line + " ");
    }
}

bool BaseScreen::CheckMinimumSize(ncpp::Plane& plane, const ScreenSize& needed) {
    unsigned rows = 0;
    unsigned cols = 0;
    plane.get_dim(rows, cols);
    if (rows >= needed.rows && cols >= needed.cols) {
        return true;
    }
    plane.erase();
    PutCentered(plane, static_cast<int>(rows) / 2,
                "Terminal too small: need " + std::to_string(needed.cols) + "x" + std::to_string(needed.rows) +
                    ", have " + std::to_string(cols) + "x" + std::to_string(rows) + ".");
    return false;
}
