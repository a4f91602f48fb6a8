#pragma once
#include "../app.hpp"

namespace karltui {

// Paint one frame of the application state onto stdscr.
void render(const Application& app);

} // namespace karltui
