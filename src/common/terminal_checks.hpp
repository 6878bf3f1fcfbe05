#pragma once

#include <cstdio>

namespace labmarker {

bool is_color_terminal() noexcept;
bool in_terminal(FILE* file) noexcept;

} // namespace labmarker
