// ============================================================================
// main.cpp — Entry point for the seq_prove tool
// ============================================================================

#include "seqprover/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        seqprover::Options opts = seqprover::parse_args(argc, argv);

        if (opts.help) {
            seqprover::print_usage(argv[0]);
            return 0;
        }

        return seqprover::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        seqprover::print_usage(argv[0]);
        return 1;
    }
}
