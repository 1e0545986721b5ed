// Flux - Entry Point
// Parses command-line arguments and runs a config

#include "cli.h"

int main(int argc, char** argv) {
    flux::cli::RunOptions options;
    if (auto code = flux::cli::parseArguments(argc, argv, options)) {
        return *code;
    }
    return flux::cli::run(options);
}
