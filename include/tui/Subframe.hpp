#ifndef TUI_SUBFRAME_HPP
#define TUI_SUBFRAME_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

// Reusable bordered pane that owns its own ncplane anchored to a parent.
class Subframe {
public:
    explicit Subframe(std::string title);
    virtual ~Subframe();

    // Resize/recreate the subframe plane based on the parent's current dimensions.
    void Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols);

    // Drops the plane until the next Resize.
    void Release();

    // Border, title and contents. Assumes Resize was called this frame.
    void Draw();

    // Input for the focused pane. Returns true when the key was used.
    virtual bool HandleInput(uint32_t input, const ncinput& details);

    void SetFocused(bool focused) { focused_ = focused; }
    bool Focused() const { return focused_; }

protected:
    struct ContentArea {
        int top;
        int left;
        int height;
        int width;
    };

    // Derived classes describe placement relative to the parent.
    virtual void ComputeGeometry(unsigned parent_rows,
                                 unsigned parent_cols,
                                 int& y,
                                 int& x,
                                 int& rows,
                                 int& cols) = 0;

    // Derived classes render into plane_; Resize ensures plane_ is valid.
    virtual void DrawContents() = 0;

    // Compute an inner content area after applying padding.
    ContentArea ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const;

    // Vertical list with the selected row highlighted and a scrollbar in the
    // last column when it overflows. scroll_offset is clamped so that selected
    // stays visible; pass selected < 0 for a list without a selection.
    void DrawList(const ContentArea& area,
                  const std::vector<std::string>& labels,
                  int selected,
                  int& scroll_offset,
                  int horizontal_offset = 0);
    void DrawScrollbar(const ContentArea& area, int item_count, int first_visible);

    void Highlight();
    void ResetColors();

    std::unique_ptr<ncpp::Plane> plane_;
    unsigned cached_rows_;
    unsigned cached_cols_;
    std::string title_;
    bool focused_;
};

// Text that fits width columns, starting at offset. Offset is clamped so the
// tail of a long label stays visible.
std::string ClipLabel(const std::string& label, int width, int offset = 0);

#endif // TUI_SUBFRAME_HPP
