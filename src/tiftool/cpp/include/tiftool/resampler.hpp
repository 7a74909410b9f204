/**
 * @file resampler.hpp
 * @brief Changing the physical pixel size of a raster
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_RESAMPLER_HPP
#define TIFTOOL_RESAMPLER_HPP

#include "tiftool/raster.hpp"

#include <tuple>

namespace tiftool {

/**
 * @struct ResizeFactors
 * @brief Multipliers applied to the pixel dimensions of a raster
 */
struct ResizeFactors {
    double fx;  ///< orig_pixel_width / target_pixel_size
    double fy;  ///< orig_pixel_height / target_pixel_size
};

/**
 * @brief Compute the factors that bring a raster to a uniform pixel size
 * @param orig_pixel_width Current pixel width in physical units
 * @param orig_pixel_height Current pixel height in physical units
 * @param target_pixel_size Requested pixel size, must be > 0
 * @throws InvalidParameterError if target_pixel_size is not positive
 */
ResizeFactors computeResizeFactors(double orig_pixel_width,
                                   double orig_pixel_height,
                                   double target_pixel_size);

/**
 * @brief Pixel dimensions after applying the factors
 *
 * Dimensions are truncated: floor(width * fx), floor(height * fy).
 *
 * @return Tuple of (width, height)
 * @throws InvalidParameterError if either dimension would be zero
 */
std::tuple<int, int> resizedDimensions(int width, int height, const ResizeFactors& factors);

/**
 * @brief Resample a raster by the given factors
 * @param raster Source raster, left unchanged
 * @param factors Factors from computeResizeFactors()
 * @return New raster with pixel size divided by the factors
 *
 * Area averaging is used when either axis shrinks, bilinear interpolation
 * otherwise.
 */
Raster resize(const Raster& raster, const ResizeFactors& factors);

} // namespace tiftool

#endif // TIFTOOL_RESAMPLER_HPP
