/**
 * @file range_analysis.cpp
 * @brief Implementation of value range and color step computations
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/range_analysis.hpp"
#include "tiftool/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace tiftool {

ValueRange analyzeRange(const std::vector<double>& samples)
{
    ValueRange range;
    range.min = std::numeric_limits<double>::max();
    range.max = -std::numeric_limits<double>::max();

    size_t valid_count = 0;
    for (double value : samples) {
        if (!std::isfinite(value)) {
            continue;
        }
        range.min = std::min(range.min, value);
        range.max = std::max(range.max, value);
        valid_count++;
    }

    if (valid_count == 0) {
        throw DegenerateRangeError("range analysis",
            "raster of " + std::to_string(samples.size()) + " samples has no finite value");
    }

    return range;
}

ValueRange analyzeRange(const Raster& raster)
{
    return analyzeRange(raster.samples());
}

double colorStepDistance(const ValueRange& range, int color_depth_bits)
{
    if (color_depth_bits < 1 || color_depth_bits > 64) {
        throw InvalidParameterError("range analysis",
            "color depth must be between 1 and 64 bit, got " +
            std::to_string(color_depth_bits));
    }

    // 2^64 - 1 is not representable as an integer type, ldexp keeps it in double
    const double steps = std::ldexp(1.0, color_depth_bits) - 1.0;
    return range.span() / steps;
}

} // namespace tiftool
