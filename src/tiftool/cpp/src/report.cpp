/**
 * @file report.cpp
 * @brief Implementation of raster metadata summaries
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/report.hpp"

namespace tiftool {

void formatReport(std::ostream& out, const RasterReport& report, bool binary_mode)
{
    out << "File path: " << report.path << "\n";
    out << "Size: " << report.width << " x " << report.height << " pixels\n";
    out << "Color depth: " << report.color_depth_bits << " bit\n";
    out << "Pixel width: " << report.pixel_width << " units\n";
    out << "Pixel height: " << report.pixel_height << " units\n";
    if (!binary_mode) {
        out << "Distance covered by one color step: " << report.color_step_distance << " units\n";
    }
}

} // namespace tiftool
