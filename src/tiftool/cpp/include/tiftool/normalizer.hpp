/**
 * @file normalizer.hpp
 * @brief Remapping raster values into the 16-bit output domain
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_NORMALIZER_HPP
#define TIFTOOL_NORMALIZER_HPP

#include "tiftool/raster.hpp"

namespace tiftool {

/**
 * @brief Number of output steps the normalized data will span
 *
 * Binary mode always uses the full 16-bit span. In continuous mode a
 * requested step distance strictly between 0 and 65535 gives
 * value_span / target_color_step_distance; anything else falls back to
 * the full span. The result is not rounded.
 *
 * @param value_span Difference between the largest and smallest sample
 * @param target_color_step_distance Requested physical units per step
 * @param binary_mode True for two-level classification output
 */
double computeColorRange(double value_span, double target_color_step_distance, bool binary_mode);

/**
 * @brief Normalize a raster to unsigned 16-bit values
 *
 * Samples are scaled to [0, 1] over the raster's own range, rounded to
 * 0 or 1 in binary mode, stretched to the color range, clipped, centered
 * inside [0, 65535] and truncated to integers. The physical size of one
 * resulting step is returned in NormalizedRaster::color_step_distance.
 *
 * @param raster Input raster, left unchanged
 * @param target_color_step_distance Requested physical units per step (0 = full range)
 * @param binary_mode True for two-level classification output
 * @throws DegenerateRangeError if all samples are equal
 */
NormalizedRaster normalize(const Raster& raster, double target_color_step_distance,
                           bool binary_mode);

} // namespace tiftool

#endif // TIFTOOL_NORMALIZER_HPP
