/**
 * @file image_sink.hpp
 * @brief Writing normalized rasters as 16-bit PNG images
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_IMAGE_SINK_HPP
#define TIFTOOL_IMAGE_SINK_HPP

#include "tiftool/raster.hpp"

#include <string>

namespace tiftool {

/**
 * @brief Save a normalized raster as a single-band 16-bit PNG
 * @param path Output file path
 * @param image Raster to write
 * @throws SinkWriteError if the file cannot be created or written
 */
void writeImage(const std::string& path, const NormalizedRaster& image);

} // namespace tiftool

#endif // TIFTOOL_IMAGE_SINK_HPP
