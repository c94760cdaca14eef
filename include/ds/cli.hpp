#pragma once

#include "ds/options.hpp"

namespace ds {

enum class ParseStatus { Ok, Help, Error };

void print_usage(const char *prog);

// Fills opt from argv. Help prints usage; Error prints the reason to stderr.
ParseStatus parse_args(int argc, char **argv, Options &opt);

} // namespace ds
