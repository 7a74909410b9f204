/**
 * @file raster.cpp
 * @brief Implementation of the in-memory raster container
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/raster.hpp"
#include "tiftool/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace tiftool {

Raster::Raster(int width, int height, std::vector<double> samples,
               double pixel_width, double pixel_height, int color_depth_bits)
    : width_(width),
      height_(height),
      samples_(std::move(samples)),
      pixel_width_(pixel_width),
      pixel_height_(pixel_height),
      color_depth_bits_(color_depth_bits)
{
    if (width_ <= 0 || height_ <= 0) {
        throw InvalidParameterError("raster",
            "dimensions must be positive, got " + std::to_string(width_) +
            "x" + std::to_string(height_));
    }

    if (samples_.size() != static_cast<size_t>(width_) * height_) {
        throw InvalidParameterError("raster",
            "expected " + std::to_string(static_cast<size_t>(width_) * height_) +
            " samples, got " + std::to_string(samples_.size()));
    }

    if (!(pixel_width_ > 0.0) || !(pixel_height_ > 0.0) ||
        !std::isfinite(pixel_width_) || !std::isfinite(pixel_height_)) {
        throw InvalidParameterError("raster",
            "pixel size must be positive, got " + std::to_string(pixel_width_) +
            " x " + std::to_string(pixel_height_));
    }

    if (color_depth_bits_ < 1 || color_depth_bits_ > 64) {
        throw InvalidParameterError("raster",
            "unsupported color depth: " + std::to_string(color_depth_bits_) + " bit");
    }
}

} // namespace tiftool
