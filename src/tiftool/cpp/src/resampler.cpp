/**
 * @file resampler.cpp
 * @brief Implementation of raster resampling on top of GDAL RasterIO
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/resampler.hpp"
#include "tiftool/errors.hpp"

#include "gdal_dataset.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tiftool {

namespace {

GDALRIOResampleAlg resampleAlgorithm(const ResizeFactors& factors)
{
    // Area averaging avoids aliasing when shrinking
    if (factors.fx < 1.0 || factors.fy < 1.0) {
        return GRIORA_Average;
    }
    return GRIORA_Bilinear;
}

int truncatedDimension(int size, double factor, const char* axis)
{
    double scaled = std::floor(size * factor);
    if (scaled > static_cast<double>(std::numeric_limits<int>::max())) {
        std::ostringstream msg;
        msg << "resized " << axis << " of " << scaled << " pixels is too large";
        throw InvalidParameterError("resampler", msg.str());
    }
    return static_cast<int>(scaled);
}

} // namespace

ResizeFactors computeResizeFactors(double orig_pixel_width,
                                   double orig_pixel_height,
                                   double target_pixel_size)
{
    if (!(target_pixel_size > 0.0) || !std::isfinite(target_pixel_size)) {
        std::ostringstream msg;
        msg << "target pixel size must be positive, got " << target_pixel_size;
        throw InvalidParameterError("resampler", msg.str());
    }

    ResizeFactors factors;
    factors.fx = orig_pixel_width / target_pixel_size;
    factors.fy = orig_pixel_height / target_pixel_size;
    return factors;
}

std::tuple<int, int> resizedDimensions(int width, int height, const ResizeFactors& factors)
{
    if (!(factors.fx > 0.0) || !(factors.fy > 0.0) ||
        !std::isfinite(factors.fx) || !std::isfinite(factors.fy)) {
        std::ostringstream msg;
        msg << "resize factors must be positive, got (" << factors.fx << ", " << factors.fy << ")";
        throw InvalidParameterError("resampler", msg.str());
    }

    int new_width = truncatedDimension(width, factors.fx, "width");
    int new_height = truncatedDimension(height, factors.fy, "height");

    if (new_width == 0 || new_height == 0) {
        std::ostringstream msg;
        msg << "resizing " << width << "x" << height << " by (" << factors.fx << ", "
            << factors.fy << ") gives an empty " << new_width << "x" << new_height << " image";
        throw InvalidParameterError("resampler", msg.str());
    }

    return std::make_tuple(new_width, new_height);
}

Raster resize(const Raster& raster, const ResizeFactors& factors)
{
    int new_width = 0;
    int new_height = 0;
    std::tie(new_width, new_height) = resizedDimensions(raster.width(), raster.height(), factors);

    detail::registerDrivers();

    // Stage the samples in a memory dataset so GDAL can resample on read
    detail::DatasetPtr src_ds = detail::createMemDataset(raster.width(), raster.height(), GDT_Float64);
    if (src_ds == nullptr) {
        throw std::runtime_error("Failed to create memory dataset for resampling");
    }

    GDALRasterBand* src_band = src_ds->GetRasterBand(1);
    CPLErr err = src_band->RasterIO(GF_Write, 0, 0, raster.width(), raster.height(),
                                    const_cast<double*>(raster.samples().data()),
                                    raster.width(), raster.height(),
                                    GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw std::runtime_error("Failed to stage raster for resampling: " +
                                 detail::lastGdalError("write error"));
    }

    GDALRasterIOExtraArg extra_arg;
    INIT_RASTERIO_EXTRA_ARG(extra_arg);
    extra_arg.eResampleAlg = resampleAlgorithm(factors);

    std::vector<double> resampled(static_cast<size_t>(new_width) * new_height);
    err = src_band->RasterIO(GF_Read, 0, 0, raster.width(), raster.height(),
                             resampled.data(), new_width, new_height,
                             GDT_Float64, 0, 0, &extra_arg);
    if (err != CE_None) {
        throw std::runtime_error("Failed to read resampled data: " +
                                 detail::lastGdalError("read error"));
    }

    return Raster(new_width, new_height, std::move(resampled),
                  raster.pixelWidth() / factors.fx,
                  raster.pixelHeight() / factors.fy,
                  raster.colorDepthBits());
}

} // namespace tiftool
