/**
 * @file command_line.hpp
 * @brief Command-line parsing for the tiftool executable
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_COMMAND_LINE_HPP
#define TIFTOOL_COMMAND_LINE_HPP

#include "tiftool/pipeline.hpp"

#include <ostream>

namespace tiftool {

/**
 * @brief Parsed command line
 */
struct CommandLineOptions {
    PipelineConfig config;
    bool show_help = false;
};

/**
 * @brief Print usage information
 */
void printUsage(std::ostream& out, const char* program_name);

/**
 * @brief Parse command-line arguments into a pipeline configuration
 *
 * Parsing stops at --help. Values are validated with validate() unless
 * help was requested.
 *
 * @throws InvalidParameterError on unknown options, missing or malformed values
 */
CommandLineOptions parseCommandLine(int argc, const char* const argv[]);

} // namespace tiftool

#endif // TIFTOOL_COMMAND_LINE_HPP
