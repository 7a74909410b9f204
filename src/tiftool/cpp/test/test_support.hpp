/**
 * @file test_support.hpp
 * @brief Helpers for creating temporary rasters in tests
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_TEST_SUPPORT_HPP
#define TIFTOOL_TEST_SUPPORT_HPP

#include "tiftool/raster.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <gdal_priv.h>

namespace tiftool {
namespace test {

// Unique temporary file name with the given extension
inline std::string tempPath(const std::string& stem, const std::string& extension) {
    static int counter = 0;
    return std::string("/tmp/") + stem + "_" + std::to_string(std::time(nullptr)) + "_" +
           std::to_string(counter++) + extension;
}

// Write a single-band GeoTIFF with the given samples
inline std::string createTestGeoTiff(int width, int height, const std::vector<double>& values,
                                     GDALDataType type = GDT_UInt16,
                                     double pixel_width = 1.0, double pixel_height = 1.0) {
    GDALAllRegister();

    std::string tempfile = tempPath("test_raster", ".tif");

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    GDALDataset* dataset = driver->Create(tempfile.c_str(), width, height, 1, type, nullptr);

    double geotransform[6] = {500000.0, pixel_width, 0.0, 4000000.0, 0.0, -pixel_height};
    dataset->SetGeoTransform(geotransform);

    std::vector<double> data(values);
    GDALRasterBand* band = dataset->GetRasterBand(1);
    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height, data.data(),
                                width, height, GDT_Float64, 0, 0);

    GDALClose(dataset);
    if (err != CE_None) {
        throw std::runtime_error("Failed to write test raster " + tempfile);
    }
    return tempfile;
}

// Samples rising linearly from first to last in row-major order
inline std::vector<double> linearRamp(int count, double first, double last) {
    std::vector<double> values(count);
    for (int i = 0; i < count; i++) {
        values[i] = first + (last - first) * i / (count - 1);
    }
    return values;
}

inline Raster makeRaster(int width, int height, const std::vector<double>& values,
                         double pixel_size = 1.0, int color_depth_bits = 16) {
    return Raster(width, height, values, pixel_size, pixel_size, color_depth_bits);
}

inline bool fileExists(const std::string& filename) {
    std::FILE* file = std::fopen(filename.c_str(), "rb");
    if (file == nullptr) {
        return false;
    }
    std::fclose(file);
    return true;
}

inline void cleanupTestFile(const std::string& filename) {
    std::remove(filename.c_str());
}

} // namespace test
} // namespace tiftool

#endif // TIFTOOL_TEST_SUPPORT_HPP
