/**
 * @file image_sink.cpp
 * @brief Implementation of PNG output through GDAL
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/image_sink.hpp"
#include "tiftool/errors.hpp"

#include "gdal_dataset.hpp"

#include <string>

namespace tiftool {

void writeImage(const std::string& path, const NormalizedRaster& image)
{
    if (image.width <= 0 || image.height <= 0 ||
        image.data.size() != static_cast<size_t>(image.width) * image.height) {
        throw SinkWriteError("image sink",
            "inconsistent image of " + std::to_string(image.width) + "x" +
            std::to_string(image.height) + " with " + std::to_string(image.data.size()) +
            " values");
    }

    detail::registerDrivers();

    // The PNG driver only supports CreateCopy, so build the image in memory first
    GDALDriver* png_driver = GetGDALDriverManager()->GetDriverByName("PNG");
    if (png_driver == nullptr) {
        throw SinkWriteError("image sink", "GDAL PNG driver is not available");
    }

    detail::DatasetPtr mem_ds = detail::createMemDataset(image.width, image.height, GDT_UInt16);
    if (mem_ds == nullptr) {
        throw SinkWriteError("image sink", "failed to create memory dataset for '" + path + "'");
    }

    GDALRasterBand* band = mem_ds->GetRasterBand(1);
    CPLErr err = band->RasterIO(GF_Write, 0, 0, image.width, image.height,
                                const_cast<uint16_t*>(image.data.data()),
                                image.width, image.height, GDT_UInt16, 0, 0);
    if (err != CE_None) {
        throw SinkWriteError("image sink",
            "failed to stage image: " + detail::lastGdalError("write error"));
    }

    CPLErrorReset();
    CPLPushErrorHandler(CPLQuietErrorHandler);
    detail::DatasetPtr png_ds(png_driver->CreateCopy(path.c_str(), mem_ds.get(), FALSE,
                                                     nullptr, nullptr, nullptr));
    CPLPopErrorHandler();

    if (png_ds == nullptr) {
        throw SinkWriteError("image sink",
            "failed to write '" + path + "': " + detail::lastGdalError("unknown error"));
    }
}

} // namespace tiftool
