#pragma once

#include <string>
#include <vector>
#include "app/StateMachine.hpp"

namespace dustpan::ui {

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Line colorization
std::string colorize_line(const std::string& s);

// Item rows the detail view shows for a terminal of the given height.
[[nodiscard]] int detail_viewport_rows(int rows);

// Exactly `rows` lines (help line + boxed view) for the machine's current state.
[[nodiscard]] std::vector<std::string> render_lines(const dustpan::app::StateMachine& sm, int cols, int rows);

// Frame rendering
void render_screen(const dustpan::app::StateMachine& sm);

} // namespace dustpan::ui
