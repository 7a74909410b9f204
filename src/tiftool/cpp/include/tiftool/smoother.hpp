/**
 * @file smoother.hpp
 * @brief Separable Gaussian smoothing of rasters
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_SMOOTHER_HPP
#define TIFTOOL_SMOOTHER_HPP

#include "tiftool/raster.hpp"

#include <vector>

namespace tiftool {

/**
 * @struct BlurSettings
 * @brief Gaussian kernel parameters
 */
struct BlurSettings {
    int kernel_size = 5;  ///< Positive odd number of taps
    double sigma = 0.0;   ///< Standard deviation; <= 0 derives it from kernel_size
};

/**
 * @brief Check that the kernel size is a positive odd integer
 * @throws InvalidParameterError otherwise
 */
void validate(const BlurSettings& settings);

/**
 * @brief Sigma actually used for the given settings
 *
 * A non-positive sigma becomes 0.3 * ((kernel_size - 1) * 0.5 - 1) + 0.8.
 */
double effectiveSigma(const BlurSettings& settings);

/**
 * @brief Normalized 1D Gaussian kernel of kernel_size taps
 *
 * With a non-positive sigma and kernel_size up to 7 the usual fixed
 * binomial tables are returned.
 *
 * @throws InvalidParameterError if kernel_size is not a positive odd integer
 */
std::vector<double> gaussianKernel(int kernel_size, double sigma);

/**
 * @brief Apply a separable Gaussian blur
 *
 * Rows are filtered first, then columns. Samples beyond the border are
 * mirrored without repeating the edge sample (dcb|abcd|cba).
 *
 * @return New raster with the same geometry as the input
 * @throws InvalidParameterError if the settings are invalid
 */
Raster blur(const Raster& raster, const BlurSettings& settings);

} // namespace tiftool

#endif // TIFTOOL_SMOOTHER_HPP
