#include "debug.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <algorithm>
#include <vector>

namespace {

constexpr int   MARGIN    = 10;
constexpr int   INSET     = 8;
constexpr int   LINE      = 15;
constexpr int   TEXT      = 10;
constexpr int   HEADING   = 11;
constexpr int   GAP       = 16;  // between the label and value columns
constexpr int   MIN_WIDTH = 200;
constexpr Color PANEL     = {16,  18,  22,  215};
constexpr Color RULE      = {70,  74,  82,  200};
constexpr Color TITLE     = {150, 150, 160, 255};
constexpr Color SECTION   = {120, 200, 220, 255};
constexpr Color LABEL     = {175, 175, 180, 255};
constexpr Color VALUE     = {245, 245, 245, 255};

using Snapshot = std::vector<DebugPanel::SectionValues>;

struct Layout {
    int label_w = 0;
    int width   = MIN_WIDTH;
    int height  = 0;
};

// Column widths follow the longest label and value.
Layout measure(const Snapshot& sections) {
    Layout l;
    int value_w = 0;
    int lines   = 1; // title
    for (const auto& sec : sections) {
        lines += 1 + static_cast<int>(sec.rows.size());
        for (const auto& [label, value] : sec.rows) {
            l.label_w = std::max(l.label_w, MeasureText(label.c_str(), TEXT));
            value_w   = std::max(value_w, MeasureText(value.c_str(), TEXT));
        }
    }
    l.width  = std::max(MIN_WIDTH, 2 * INSET + l.label_w + GAP + value_w);
    l.height = 2 * INSET + lines * LINE + static_cast<int>(sections.size()) * 4;
    return l;
}

} // namespace

void DebugSystem::Draw(corridor::Context& ctx) {
    auto* panel = ctx.try_resource<DebugPanel>();
    if (!panel) return;

    auto* input = ctx.try_resource<InputRecord>();
    if (input && input->was_pressed(Keys::F3)) panel->toggle();
    if (!panel->visible) return;

    const Snapshot sections = panel->snapshot();
    const Layout   layout   = measure(sections);

    // Anchored to the top-right corner, clear of the HUD line.
    const int x = GetScreenWidth() - MARGIN - layout.width;
    int       y = MARGIN;
    DrawRectangle(x, y, layout.width, layout.height, PANEL);
    DrawRectangleLines(x, y, layout.width, layout.height, RULE);

    y += INSET;
    DrawText("DEBUG  [F3]", x + INSET, y, HEADING, TITLE);
    y += LINE;

    const int value_x = x + INSET + layout.label_w + GAP;
    for (const auto& sec : sections) {
        DrawLine(x + INSET, y + 1, x + layout.width - INSET, y + 1, RULE);
        y += 4;
        DrawText(sec.title.c_str(), x + INSET, y, HEADING, SECTION);
        y += LINE;
        for (const auto& [label, value] : sec.rows) {
            DrawText(label.c_str(), x + INSET, y, TEXT, LABEL);
            DrawText(value.c_str(), value_x, y, TEXT, VALUE);
            y += LINE;
        }
    }
}
