// config.hpp - run configuration sourced from the environment and argv
#pragma once
#include <stdexcept>
#include <string>

namespace ipparse {

struct usage_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct config {
    std::string input_path;   // empty -> standard input
    int indent_width = 2;
    bool suggest = true;      // "did you mean" notes on unknown opcodes
    bool verbose = false;
    bool show_help = false;
};

// Exit status for command line misuse; not one of the pipeline classes.
constexpr int usage_exit_code = 10;

// Boolean switch from the environment: a value starting with 1, t or y turns it
// on, 0, f or n turns it off. Unset or anything else yields fallback.
bool env_flag(const char* name, bool fallback);

// IPPARSE_SUGGEST (default on), IPPARSE_VERBOSE, IPPARSE_INDENT.
// IPPARSE_DIAG_JSON is read at report time by maybe_print_json().
config config_from_env();

// Applies command line options on top of cfg. Throws usage_error.
void parse_args(int argc, char** argv, config& cfg);

std::string usage_text(const std::string& prog);

} // namespace ipparse
