/**
 * @file gdal_dataset.hpp
 * @brief Scoped GDAL dataset handles used by the I/O and resampling stages
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_GDAL_DATASET_HPP
#define TIFTOOL_GDAL_DATASET_HPP

#include <memory>
#include <string>

#include <cpl_error.h>
#include <gdal_priv.h>

namespace tiftool {
namespace detail {

struct DatasetCloser {
    void operator()(GDALDataset* dataset) const {
        if (dataset != nullptr) {
            GDALClose(dataset);
        }
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

/**
 * @brief Register GDAL drivers; safe to call repeatedly
 */
inline void registerDrivers() {
    GDALAllRegister();
}

/**
 * @brief Last message reported by GDAL, or a fallback text if there is none
 */
inline std::string lastGdalError(const std::string& fallback) {
    const char* message = CPLGetLastErrorMsg();
    if (message == nullptr || message[0] == '\0') {
        return fallback;
    }
    return message;
}

/**
 * @brief Create an anonymous single-band in-memory dataset
 * @return Dataset, or nullptr if the MEM driver is unavailable
 */
inline DatasetPtr createMemDataset(int width, int height, GDALDataType type) {
    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (mem_driver == nullptr) {
        return DatasetPtr();
    }
    return DatasetPtr(mem_driver->Create("", width, height, 1, type, nullptr));
}

} // namespace detail
} // namespace tiftool

#endif // TIFTOOL_GDAL_DATASET_HPP
