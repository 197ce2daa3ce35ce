// File: src/cli/main.cpp
#include "cli/algoseq_cli.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        algoseq::AlgoseqCli cli;
        return cli.Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
