#pragma once

#include "qg/options.hpp"

namespace qg
{
enum class CliStatus { Ok, Help, Error };

void print_usage(const char *prog);

// Fill opt from argv. Diagnostics go to stderr; Help means usage was printed.
CliStatus parse_args(int argc, char **argv, Options &opt);
} // namespace qg
