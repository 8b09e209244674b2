/**
 * @file main.cpp
 * @brief Main entry point for typo-fit
 *
 * Text width estimation, truncation and font size scaling from the
 * command line.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include <string>

using namespace typo;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;

        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or an error
        }

        return cli.run();

    } catch (const std::exception& e) {
        Logger logger("main");
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}

// Example usage commands:
//
// Width of a caption at 12pt:
// ./typo-fit estimate --text "North Cascades" --font-size 12pt
//
// Fit a label into 40mm with an ellipsis:
// ./typo-fit truncate --text "Mount Rainier National Park" --width 40mm --tail ...
//
// Keep a heading proportional to its panel:
// ./typo-fit scale-box --from 200x40 --to 300x80 --ratio 0.5
//
// Shrink text as a value drops below its threshold:
// ./typo-fit scale-threshold --threshold 800 --value 400 --direction -1 --font-size 24
