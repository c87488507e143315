// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "seqprover/cli.hpp"
#include "seqprover/names.hpp"
#include "seqprover/prover.hpp"
#include "seqprover/sequent.hpp"
#include "seqprover/test.hpp"
#include "seqprover/utils.hpp"
#include "seqprover/z3_solver.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace seqprover {

namespace {

int parse_count(const std::string& option, int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::runtime_error(option + " requires a number argument");
    }
    const std::string value = argv[++i];
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(option + " expects a number, got '" + value + "'");
    }
    if (n < 0) {
        throw std::runtime_error(option + " must be >= 0");
    }
    return n;
}

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--model") {
            opts.show_model = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--trace") {
            opts.show_trace = true;
        } else if (arg == "--z3") {
            opts.use_z3 = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--depth") {
            opts.max_depth = static_cast<std::uint32_t>(parse_count(arg, argc, argv, i));
        } else if (arg == "--names") {
            opts.max_names = static_cast<std::uint32_t>(parse_count(arg, argc, argv, i));
        } else if (arg == "--timeout") {
            opts.timeout_s = parse_count(arg, argc, argv, i);
        } else if (arg == "--threads" || arg == "-j") {
            opts.num_threads = parse_count(arg, argc, argv, i);
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            // A sequent may legitimately start with '~' or '|~', never '--'.
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple inputs not supported");
            }
            opts.input = arg;
        }
    }

    if (!opts.selftest && !opts.help && opts.input.empty()) {
        throw std::runtime_error("no input specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] <sequent | input.txt>\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "First-order sequent-calculus prover.\n"
        << "\n"
        << "Options:\n"
        << "  <sequent> | <input.txt>  Sequent such as \"A, (A > B) |~ B\", or a\n"
        << "                           file with one sequent per line\n"
        << "  --selftest    Run built-in tests\n"
        << "  --stats       Show search statistics\n"
        << "  --trace       Print the explored decomposition tree (single thread)\n"
        << "  --model       Show a counter-sequent and Z3 counter-model when unproved\n"
        << "  --z3          Use Z3 to close quantifier-free sequents\n"
        << "  --depth N     Maximum rule applications along a branch (default 64)\n"
        << "  --names N     Maximum witnesses tried per quantifier rule (default 16)\n"
        << "  --timeout S   Give up after S seconds (0 = none, default)\n"
        << "  --threads N, -j N  Set number of OpenMP threads (0 = auto, default)\n"
        << "  --help, -h    Show this message\n"
        << "\n"
        << "Input format:\n"
        << "  - One sequent per line, sides separated by |~, members by commas\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n"
        << "\n"
        << "Verdicts:\n"
        << "  PROVED     a closed proof tree was found\n"
        << "  UNPROVED   the complete search left an open branch\n"
        << "  EXHAUSTED  no proof found, but a bound was hit or a forall-left /\n"
        << "             exists-right step failed (those steps are applied once,\n"
        << "             so a valid sequent may still land here)\n";
}

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver loop.  Reads the input, proves each sequent line, prints
// results.

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    if (opts.input.empty()) {
        std::cerr << "ERROR: no input specified (use --help for usage)\n";
        return 1;
    }

    // If it ends with .txt assume a file, otherwise a single sequent.
    std::vector<std::string> lines;
    if (opts.input.ends_with(".txt")) {
        try {
            lines = read_lines(opts.input);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    } else {
        lines.push_back(opts.input);
    }

    SequentialNameSupply names;
    ProofSearch search(names);

    SearchLimits limits;
    limits.max_depth = opts.max_depth;
    limits.max_names = opts.max_names;
    limits.timeout = std::chrono::seconds(opts.timeout_s);
    search.set_limits(limits);
    search.set_closure_mode(opts.use_z3 ? ClosureMode::Z3 : ClosureMode::Syntactic);
    search.set_record_trace(opts.show_trace);
    if (opts.show_trace) {
        search.set_num_threads(1);
    } else if (opts.num_threads > 0) {
        search.set_num_threads(opts.num_threads);
    }

    bool had_errors = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::uint32_t line_num = static_cast<std::uint32_t>(i + 1);
        if (is_blank_or_comment(lines[i])) {
            continue;
        }
        std::string content = strip_comment(lines[i]);

        try {
            Sequent goal = parse_sequent(content, line_num);
            Result result = search.prove(goal);

            std::cout << line_num << ": " << result_to_string(result) << "\n";

            if (opts.show_stats) {
                std::cout << "  Stats: " << search.stats().to_string()
                          << " time=" << result.elapsed_s << "s\n";
            }

            if (opts.show_trace) {
                for (const auto& t : search.trace()) {
                    std::cout << "  " << t << "\n";
                }
            }

            if (opts.show_model && result != Result::Proved) {
                const auto& counter = search.counter_sequent();
                if (!counter) {
                    std::cout << "  Counter-sequent: (none reached)\n";
                } else {
                    std::cout << "  Counter-sequent: " << counter->to_string() << "\n";
                    Z3Checker checker;
                    if (checker.add_sequent_negation(*counter) &&
                        checker.check() == Z3Result::SAT) {
                        std::cout << "  Counter-model: " << checker.get_model() << "\n";
                    }
                }
            }

        } catch (const std::exception& e) {
            // Parse errors already carry the line number.
            std::cerr << e.what() << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace seqprover
