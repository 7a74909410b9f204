/**
 * @file command_line.cpp
 * @brief Implementation of command-line parsing
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/command_line.hpp"
#include "tiftool/errors.hpp"

#include <stdexcept>
#include <string>

namespace tiftool {

namespace {

double parseDouble(const std::string& option, const std::string& value)
{
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw InvalidParameterError("command line",
            "invalid number '" + value + "' for " + option);
    }
    return result;
}

int parseInt(const std::string& option, const std::string& value)
{
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw InvalidParameterError("command line",
            "invalid integer '" + value + "' for " + option);
    }
    return result;
}

} // namespace

void printUsage(std::ostream& out, const char* program_name)
{
    out << "Usage: " << program_name << " [options] <input_file>\n";
    out << "Convert a single-band GeoTIFF into a normalized 16-bit PNG.\n";
    out << "Options:\n";
    out << "  -s, --new_pixel_size SIZE       Width and height covered by one output pixel (default: keep)\n";
    out << "  -c, --new_color_step_dist DIST  Distance covered by one output color step (default: full range)\n";
    out << "  -g, --gblur                     Add Gaussian blur\n";
    out << "  -k, --kernel_size N             Blur kernel size, odd (default: 5)\n";
    out << "  -x, --sigma SIGMA               Blur sigma, 0 derives it from the kernel size (default: 0)\n";
    out << "  -b, --binary                    Enable binary mode\n";
    out << "  -o, --output FILE               Output file (default: input with .png extension)\n";
    out << "  -q, --quiet                     Do not print the input and result summaries\n";
    out << "  -h, --help                      Display this help message\n";
}

CommandLineOptions parseCommandLine(int argc, const char* const argv[])
{
    CommandLineOptions options;
    PipelineConfig& config = options.config;

    bool blur_enabled = false;
    bool blur_parameters_given = false;
    BlurSettings blur_settings;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (arg == "-g" || arg == "--gblur") {
            blur_enabled = true;
        } else if (arg == "-b" || arg == "--binary") {
            config.binary_mode = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-s" || arg == "--new_pixel_size" ||
                   arg == "-c" || arg == "--new_color_step_dist" ||
                   arg == "-k" || arg == "--kernel_size" ||
                   arg == "-x" || arg == "--sigma" ||
                   arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                throw InvalidParameterError("command line", "missing argument for option: " + arg);
            }
            std::string value = argv[++i];

            if (arg == "-s" || arg == "--new_pixel_size") {
                config.new_pixel_size = parseDouble(arg, value);
            } else if (arg == "-c" || arg == "--new_color_step_dist") {
                config.new_color_step_dist = parseDouble(arg, value);
            } else if (arg == "-k" || arg == "--kernel_size") {
                blur_settings.kernel_size = parseInt(arg, value);
                blur_parameters_given = true;
            } else if (arg == "-x" || arg == "--sigma") {
                blur_settings.sigma = parseDouble(arg, value);
                blur_parameters_given = true;
            } else {
                config.output_path = value;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw InvalidParameterError("command line", "unknown option: " + arg);
        } else if (config.input_path.empty()) {
            config.input_path = arg;
        } else {
            throw InvalidParameterError("command line", "unexpected argument: " + arg);
        }
    }

    if (blur_parameters_given && !blur_enabled) {
        throw InvalidParameterError("command line",
            "--kernel_size and --sigma require --gblur");
    }
    if (blur_enabled) {
        config.blur = blur_settings;
    }

    validate(config);
    return options;
}

} // namespace tiftool
