/**
 * @file report.hpp
 * @brief Human-readable raster metadata summaries
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_REPORT_HPP
#define TIFTOOL_REPORT_HPP

#include <ostream>
#include <string>

namespace tiftool {

/**
 * @struct RasterReport
 * @brief Metadata printed before and after conversion
 */
struct RasterReport {
    std::string path;
    int width = 0;
    int height = 0;
    int color_depth_bits = 0;
    double pixel_width = 0.0;
    double pixel_height = 0.0;
    double color_step_distance = 0.0;
};

/**
 * @brief Write the report, one "Label: value" line per field
 *
 * The color step distance is omitted in binary mode, where it has no
 * physical meaning.
 */
void formatReport(std::ostream& out, const RasterReport& report, bool binary_mode);

} // namespace tiftool

#endif // TIFTOOL_REPORT_HPP
