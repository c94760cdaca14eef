#pragma once

#include <string_view>

namespace ds {

// Whole-line writes serialized across threads.
void out_line(std::string_view line);
void err_line(std::string_view line);

// Writes a pre-formatted block (may contain several lines) to stdout.
void out_block(std::string_view text);

} // namespace ds
