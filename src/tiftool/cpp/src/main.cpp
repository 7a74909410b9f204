// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "tiftool/command_line.hpp"
#include "tiftool/errors.hpp"
#include "tiftool/pipeline.hpp"

#include <exception>
#include <iostream>

using namespace tiftool;

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    try {
        options = parseCommandLine(argc, argv);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    if (options.show_help) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    try {
        PipelineResult result = runPipeline(options.config, std::cout);
        if (!options.config.quiet) {
            std::cout << "Image saved to " << result.output_path << std::endl;
        }
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
