// ============================================================================
// pmc/cli.hpp - Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: pick a built-in model, register every formula of the input,
// build the probability matrix once, then evaluate the formulas.
//
// ============================================================================

#ifndef PMC_CLI_HPP
#define PMC_CLI_HPP

#include <cstdint>
#include <string>

namespace pmc {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string  input;          // formula or .txt file (may be empty)
    std::string  model;          // built-in model name
    std::string  dot_path;       // write the NMDP as Graphviz DOT
    std::string  json_path;      // write the NMDP as JSON
    bool         selftest = false;
    bool         show_stats = false;
    bool         list_models = false;
    bool         help = false;
    bool         no_forward = false;
    int          num_threads = 0;        // OpenMP threads (0 = default)
    double       epsilon = 1e-9;
    std::int64_t max_states = 1 << 24;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors).
int run(const Options& opts);

}  // namespace pmc

#endif  // PMC_CLI_HPP
