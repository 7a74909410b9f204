/**
 * @file pipeline.hpp
 * @brief End-to-end GeoTIFF to 16-bit PNG conversion
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_PIPELINE_HPP
#define TIFTOOL_PIPELINE_HPP

#include "tiftool/raster.hpp"
#include "tiftool/report.hpp"
#include "tiftool/smoother.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace tiftool {

/**
 * @brief Configuration for a conversion run
 */
struct PipelineConfig {
    std::string input_path;               // Raster to convert
    std::string output_path;              // Empty = input path with a .png extension
    double new_pixel_size = 0.0;          // Target pixel size (0 = keep the source size)
    double new_color_step_dist = 0.0;     // Target color step distance (0 = full 16-bit range)
    std::optional<BlurSettings> blur;     // Gaussian blur, disabled when empty
    bool binary_mode = false;             // Two-level classification output
    bool quiet = false;                   // Suppress the reports
};

/**
 * @brief Outcome of a conversion run
 */
struct PipelineResult {
    std::string output_path;
    NormalizedRaster image;
    RasterReport input_report;
    RasterReport output_report;
};

/**
 * @brief Check every parameter that can be checked without opening the input
 * @throws InvalidParameterError on the first invalid value
 */
void validate(const PipelineConfig& config);

/**
 * @brief Replace the extension of the input path with .png
 *
 * The extension is appended when the file name has none.
 */
std::string deriveOutputPath(const std::string& input_path);

/**
 * @brief Output path of a run: the configured one or the derived one
 * @throws InvalidParameterError if the output would overwrite the input
 */
std::string resolveOutputPath(const PipelineConfig& config);

/**
 * @brief Run the whole conversion
 *
 * Reads the source, optionally resamples and blurs it, normalizes it to
 * 16 bit and writes the PNG. Progress and the INPUT/RESULT reports go to
 * out unless config.quiet is set.
 *
 * @param config Validated or unvalidated configuration
 * @param out Stream for progress and reports
 * @return The written image and the reports
 */
PipelineResult runPipeline(const PipelineConfig& config, std::ostream& out);

} // namespace tiftool

#endif // TIFTOOL_PIPELINE_HPP
