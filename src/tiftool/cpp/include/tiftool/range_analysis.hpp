/**
 * @file range_analysis.hpp
 * @brief Value range and color step computations
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_RANGE_ANALYSIS_HPP
#define TIFTOOL_RANGE_ANALYSIS_HPP

#include "tiftool/raster.hpp"

#include <vector>

namespace tiftool {

/**
 * @struct ValueRange
 * @brief Minimum and maximum sample value of a raster
 */
struct ValueRange {
    double min;
    double max;

    double span() const { return max - min; }
};

/**
 * @brief Compute the value range of a sample buffer
 * @param samples Samples to scan; NaN and infinite values are skipped
 * @return Range of the finite samples
 * @throws DegenerateRangeError if there is no valid sample
 */
ValueRange analyzeRange(const std::vector<double>& samples);

/**
 * @brief Compute the value range of a raster
 */
ValueRange analyzeRange(const Raster& raster);

/**
 * @brief Physical units represented by one digital step
 *
 * Divides the range span by the number of steps of a color_depth_bits
 * encoding, 2^bits - 1. A constant range gives 0.
 *
 * @param range Value range of the raster
 * @param color_depth_bits Bit width of the encoding, 1 to 64
 * @throws InvalidParameterError if color_depth_bits is out of range
 */
double colorStepDistance(const ValueRange& range, int color_depth_bits);

} // namespace tiftool

#endif // TIFTOOL_RANGE_ANALYSIS_HPP
