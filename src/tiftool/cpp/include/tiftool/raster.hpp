/**
 * @file raster.hpp
 * @brief In-memory raster containers shared by all pipeline stages
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_RASTER_HPP
#define TIFTOOL_RASTER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tiftool {

/// Maximum digital value of the 16-bit output encoding
constexpr double MAX_OUTPUT_VALUE = 65535.0;

/// Bit depth of every normalized output raster
constexpr int OUTPUT_COLOR_DEPTH_BITS = 16;

/**
 * @class Raster
 * @brief Single-band grid of samples with its physical pixel size
 *
 * Samples are stored row-major in a contiguous buffer. A Raster is never
 * modified after construction; pipeline stages return new instances.
 */
class Raster {
public:
    /**
     * @brief Constructor
     * @param width Number of columns
     * @param height Number of rows
     * @param samples Row-major sample buffer of width * height values
     * @param pixel_width Physical units covered by one pixel along x
     * @param pixel_height Physical units covered by one pixel along y
     * @param color_depth_bits Bit width of the source sample encoding
     * @throws InvalidParameterError on inconsistent dimensions or pixel size
     */
    Raster(int width, int height, std::vector<double> samples,
           double pixel_width, double pixel_height, int color_depth_bits);

    int width() const { return width_; }
    int height() const { return height_; }
    double pixelWidth() const { return pixel_width_; }
    double pixelHeight() const { return pixel_height_; }
    int colorDepthBits() const { return color_depth_bits_; }

    const std::vector<double>& samples() const { return samples_; }

    double at(int x, int y) const {
        return samples_[static_cast<size_t>(y) * width_ + x];
    }

private:
    int width_;
    int height_;
    std::vector<double> samples_;
    double pixel_width_;
    double pixel_height_;
    int color_depth_bits_;
};

/**
 * @struct NormalizedRaster
 * @brief 16-bit output grid with the physical meaning of one digital step
 */
struct NormalizedRaster {
    int width = 0;
    int height = 0;
    std::vector<uint16_t> data;        ///< Row-major digital values
    double color_step_distance = 0.0;  ///< Physical units per digital step
    double color_range = 0.0;          ///< Number of steps actually spanned (real-valued)
    int color_depth_bits = OUTPUT_COLOR_DEPTH_BITS;

    uint16_t at(int x, int y) const {
        return data[static_cast<size_t>(y) * width + x];
    }
};

/**
 * @struct SourceRaster
 * @brief Raster as loaded from disk together with its source scale
 */
struct SourceRaster {
    std::string path;
    Raster raster;
    double color_step_distance;  ///< (max - min) / (2^bits - 1)
};

} // namespace tiftool

#endif // TIFTOOL_RASTER_HPP
