// ============================================================================
// seqprover/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: read input → parse sequent → prove → print verdict.
//
// ============================================================================

#ifndef SEQPROVER_CLI_HPP
#define SEQPROVER_CLI_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace seqprover {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string   input;   // sequent text or path to a .txt file
    bool          selftest = false;
    bool          show_model = false;
    bool          show_stats = false;
    bool          show_trace = false;
    bool          use_z3 = false;     // Z3 closure oracle
    bool          help = false;
    std::uint32_t max_depth = 64;
    std::uint32_t max_names = 16;
    int           timeout_s = 0;      // 0 = none
    int           num_threads = 0;    // OpenMP threads (0 = default)
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver: read input, prove each sequent, print results.
/// Returns the process exit code (0 = ok, 1 = errors encountered).
int run(const Options& opts);

}  // namespace seqprover

#endif  // SEQPROVER_CLI_HPP
