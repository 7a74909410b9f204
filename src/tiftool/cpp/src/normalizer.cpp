/**
 * @file normalizer.cpp
 * @brief Implementation of 16-bit value normalization
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/normalizer.hpp"
#include "tiftool/errors.hpp"
#include "tiftool/range_analysis.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tiftool {

double computeColorRange(double value_span, double target_color_step_distance, bool binary_mode)
{
    if (!binary_mode && target_color_step_distance > 0.0 &&
        target_color_step_distance < MAX_OUTPUT_VALUE) {
        return value_span / target_color_step_distance;
    }
    return MAX_OUTPUT_VALUE;
}

NormalizedRaster normalize(const Raster& raster, double target_color_step_distance,
                           bool binary_mode)
{
    const ValueRange range = analyzeRange(raster);
    const double span = range.span();

    if (!(span > 0.0)) {
        std::ostringstream msg;
        msg << "all samples equal " << range.min << ", nothing to normalize";
        throw DegenerateRangeError("normalizer", msg.str());
    }

    const double color_range = computeColorRange(span, target_color_step_distance, binary_mode);
    const double offset = (MAX_OUTPUT_VALUE - color_range) / 2.0;

    NormalizedRaster result;
    result.width = raster.width();
    result.height = raster.height();
    result.color_range = color_range;
    result.color_step_distance = span / color_range;
    result.data.resize(raster.samples().size());

    const std::vector<double>& samples = raster.samples();
    for (size_t i = 0; i < samples.size(); i++) {
        double u = (samples[i] - range.min) / span;
        if (binary_mode) {
            u = std::nearbyint(u);
        }
        u *= color_range;

        // NaN samples map to the bottom of the color range, infinities clip to the ends
        double value = std::isnan(u) ? 0.0 : std::min(std::max(u, 0.0), color_range);
        value += offset;

        // A step finer than the range allows pushes values past 16 bits
        value = std::min(std::max(value, 0.0), MAX_OUTPUT_VALUE);
        result.data[i] = static_cast<uint16_t>(value);
    }

    return result;
}

} // namespace tiftool
