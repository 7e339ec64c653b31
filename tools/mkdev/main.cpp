/**
 * @file main.cpp
 * @brief mkdev - write an image onto a device with auto-tuned buffering
 *
 * Usage: mkdev [OPTIONS] SOURCE TARGET
 */

#include "cli.hpp"

#include <cstdio>

int main(int argc, char **argv) {
    mkdev::cli::Config config;
    switch (mkdev::cli::parse_args(argc, argv, config)) {
    case mkdev::cli::ParseResult::Help:
        return 0;
    case mkdev::cli::ParseResult::Error:
        return 1;
    default:
        break;
    }
    return mkdev::cli::run(config, stdin);
}
