/**
 * @file raster_source.hpp
 * @brief Reading single-band rasters (GeoTIFF and other GDAL formats)
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_RASTER_SOURCE_HPP
#define TIFTOOL_RASTER_SOURCE_HPP

#include "tiftool/raster.hpp"

#include <memory>
#include <string>
#include <tuple>

namespace tiftool {

/**
 * @class RasterSource
 * @brief Open raster file from which band 1 is read
 *
 * The underlying GDAL dataset stays open for the lifetime of the object and
 * is closed by the destructor.
 */
class RasterSource {
public:
    /**
     * @brief Constructor
     * @param path Path to the raster file
     * @throws SourceOpenError if the file cannot be opened or has no band
     */
    explicit RasterSource(const std::string& path);

    ~RasterSource();

    RasterSource(const RasterSource&) = delete;
    RasterSource& operator=(const RasterSource&) = delete;

    const std::string& path() const;

    /**
     * @brief Get raster dimensions
     * @return Tuple of (width, height)
     */
    std::tuple<int, int> getDimensions() const;

    /**
     * @brief Number of bands in the file; only band 1 is used
     */
    int bandCount() const;

    /**
     * @brief Bit width of band 1's native sample type
     */
    int colorDepthBits() const;

    /**
     * @brief Absolute x and y scale of the affine transform
     * @return Tuple of (pixel_width, pixel_height)
     */
    std::tuple<double, double> getPixelSize() const;

    /**
     * @brief Read band 1 and compute the source color step distance
     * @throws SourceOpenError if the band cannot be read
     */
    SourceRaster read() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Open, read and close a raster file in one call
 */
SourceRaster loadRaster(const std::string& path);

} // namespace tiftool

#endif // TIFTOOL_RASTER_SOURCE_HPP
