/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Demo entry point for the prettylog library.
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing (optional template path, optional `--save` target).
 * 2. Logger construction, from the template when one is given.
 * 3. One event per severity, then an explicit flush of the file output.
 */

#include "prettylog/core/error.hpp"
#include "prettylog/infra/diagnostics.hpp"
#include "prettylog/logging/logger.hpp"

#include <iostream>
#include <memory>
#include <string>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [TEMPLATE_PATH] [--save OUTPUT_PATH]\n"
              << "Options:\n"
              << "  TEMPLATE_PATH        JSON logger template to load (Default: built-in preset)\n"
              << "  --save OUTPUT_PATH   Write the active template to OUTPUT_PATH and exit\n"
              << "  --help               Show this help message\n";
}

int main(int argc, char* argv[])
{
    using prettylog::infra::DiagLevel;
    using prettylog::infra::Diagnostics;

    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string template_path;
    std::string save_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--save") {
            if (i + 1 >= argc) {
                print_help(argv[0]);
                return 1;
            }
            save_path = argv[++i];
        } else {
            template_path = arg;
        }
    }

    try {
        std::unique_ptr<prettylog::logging::Logger> logger =
            template_path.empty() ? std::make_unique<prettylog::logging::Logger>()
                                  : prettylog::logging::Logger::from_template(template_path);

        if (!save_path.empty()) {
            logger->save_template(save_path);
            std::cout << "Template written to '" << save_path << "'" << std::endl;
            return 0;
        }

        logger->debug("Demo: debug message (hidden under Standard verbosity)");
        logger->info("Demo: informational message");
        logger->warning("Demo: warning message");
        logger->error("Demo: error message");
        logger->fatal("Demo: fatal message");
        logger->flush();

    } catch (const prettylog::core::Error& e) {
        Diagnostics::report(DiagLevel::ERROR,
                            "Demo: " + prettylog::core::to_string(e.kind()) + " error: " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Diagnostics::report(DiagLevel::ERROR, "Demo: Critical failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
