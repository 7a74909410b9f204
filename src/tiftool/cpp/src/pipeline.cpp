/**
 * @file pipeline.cpp
 * @brief Implementation of the conversion pipeline
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/pipeline.hpp"
#include "tiftool/errors.hpp"
#include "tiftool/image_sink.hpp"
#include "tiftool/normalizer.hpp"
#include "tiftool/raster_source.hpp"
#include "tiftool/resampler.hpp"

#include <cmath>
#include <filesystem>
#include <sstream>
#include <utility>

namespace tiftool {

namespace {

void requireNonNegative(double value, const char* name)
{
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream msg;
        msg << name << " must be a non-negative number, got " << value;
        throw InvalidParameterError("configuration", msg.str());
    }
}

} // namespace

void validate(const PipelineConfig& config)
{
    if (config.input_path.empty()) {
        throw InvalidParameterError("configuration", "no input file given");
    }

    requireNonNegative(config.new_pixel_size, "new pixel size");
    requireNonNegative(config.new_color_step_dist, "new color step distance");

    if (config.blur) {
        validate(*config.blur);
    }
}

std::string deriveOutputPath(const std::string& input_path)
{
    std::filesystem::path path(input_path);
    path.replace_extension(".png");
    return path.string();
}

std::string resolveOutputPath(const PipelineConfig& config)
{
    std::string output = config.output_path.empty() ? deriveOutputPath(config.input_path)
                                                    : config.output_path;
    if (output == config.input_path) {
        throw InvalidParameterError("configuration",
            "output path '" + output + "' would overwrite the input");
    }
    return output;
}

PipelineResult runPipeline(const PipelineConfig& config, std::ostream& out)
{
    validate(config);

    PipelineResult result;
    result.output_path = resolveOutputPath(config);

    SourceRaster source = loadRaster(config.input_path);

    result.input_report.path = source.path;
    result.input_report.width = source.raster.width();
    result.input_report.height = source.raster.height();
    result.input_report.color_depth_bits = source.raster.colorDepthBits();
    result.input_report.pixel_width = source.raster.pixelWidth();
    result.input_report.pixel_height = source.raster.pixelHeight();
    result.input_report.color_step_distance = source.color_step_distance;

    if (!config.quiet) {
        out << "INPUT" << std::endl;
        formatReport(out, result.input_report, config.binary_mode);
    }

    // Reject an empty resample before doing any numeric work
    std::optional<ResizeFactors> factors;
    if (config.new_pixel_size > 0.0) {
        factors = computeResizeFactors(source.raster.pixelWidth(),
                                       source.raster.pixelHeight(),
                                       config.new_pixel_size);
        resizedDimensions(source.raster.width(), source.raster.height(), *factors);
    }

    if (!config.quiet) {
        out << "Processing..." << std::endl;
    }

    Raster current = std::move(source.raster);
    if (factors) {
        current = resize(current, *factors);
    }
    if (config.blur) {
        current = blur(current, *config.blur);
    }

    result.image = normalize(current, config.new_color_step_dist, config.binary_mode);

    if (!config.quiet) {
        out << "Done" << std::endl;
    }

    result.output_report.path = result.output_path;
    result.output_report.width = result.image.width;
    result.output_report.height = result.image.height;
    result.output_report.color_depth_bits = result.image.color_depth_bits;
    result.output_report.pixel_width = factors ? config.new_pixel_size
                                               : result.input_report.pixel_width;
    result.output_report.pixel_height = factors ? config.new_pixel_size
                                                : result.input_report.pixel_height;
    result.output_report.color_step_distance = result.image.color_step_distance;

    if (!config.quiet) {
        out << "RESULT" << std::endl;
        formatReport(out, result.output_report, config.binary_mode);
    }

    writeImage(result.output_path, result.image);

    return result;
}

} // namespace tiftool
