// ============================================================================
// main.cpp - Entry point for the pmc tool
// ============================================================================

#include "pmc/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        pmc::Options opts = pmc::parse_args(argc, argv);

        if (opts.help) {
            pmc::print_usage(argv[0]);
            return 0;
        }

        return pmc::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        pmc::print_usage(argv[0]);
        return 1;
    }
}
