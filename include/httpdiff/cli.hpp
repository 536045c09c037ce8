#pragma once

#include "types.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace httpdiff {

// Command line of the httpdiff tool
struct Options {
    std::string program = "httpdiff";
    std::string first_file;
    std::string second_file;
    Config config;
    std::optional<size_t> first_index;
    std::optional<size_t> second_index;
    bool list_only = false;
    bool help = false;       // usage requested or the command line was rejected
};

void print_usage(std::ostream& out, std::string_view program);

// Non-negative record index given as an option value
bool parse_index(std::string_view text, std::optional<size_t>& out);

// Parse argv. Problems are reported on err and leave help set.
// Colors start disabled when NO_COLOR is set in the environment.
Options parse_args(int argc, const char* const argv[], std::ostream& err);

// Load both capture files and run the selected mode: listing, one pair, or
// the interactive loop (stopped early once *running turns false).
// Returns the process exit status.
int run_cli(const Options& opts, std::istream& in, std::ostream& out, std::ostream& err,
            const volatile bool* running = nullptr);

} // namespace httpdiff
