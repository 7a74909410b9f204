/**
 * @file raster_source.cpp
 * @brief Implementation of GDAL-backed raster reading
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/raster_source.hpp"
#include "tiftool/errors.hpp"
#include "tiftool/range_analysis.hpp"

#include "gdal_dataset.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tiftool {

class RasterSource::Impl {
public:
    explicit Impl(const std::string& path)
        : path_(path)
    {
        detail::registerDrivers();

        CPLErrorReset();
        CPLPushErrorHandler(CPLQuietErrorHandler);
        dataset_.reset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
        CPLPopErrorHandler();

        if (dataset_ == nullptr) {
            throw SourceOpenError("raster source",
                "failed to open '" + path + "': " +
                detail::lastGdalError("unrecognized or missing file"));
        }

        if (dataset_->GetRasterCount() < 1) {
            throw SourceOpenError("raster source", "'" + path + "' has no raster band");
        }

        width_ = dataset_->GetRasterXSize();
        height_ = dataset_->GetRasterYSize();

        // Only the scale terms are used; rotation terms are ignored
        if (dataset_->GetGeoTransform(geo_transform_) != CE_None) {
            std::cerr << "Warning: '" << path << "' has no geotransform, "
                      << "assuming a pixel size of 1 unit" << std::endl;
            geo_transform_[1] = 1.0;
            geo_transform_[5] = -1.0;
        }

        pixel_width_ = std::abs(geo_transform_[1]);
        pixel_height_ = std::abs(geo_transform_[5]);
        if (!(pixel_width_ > 0.0) || !(pixel_height_ > 0.0)) {
            throw SourceOpenError("raster source",
                "'" + path + "' has a degenerate pixel size " +
                std::to_string(pixel_width_) + " x " + std::to_string(pixel_height_));
        }

        GDALRasterBand* band = dataset_->GetRasterBand(1);
        color_depth_bits_ = GDALGetDataTypeSizeBits(band->GetRasterDataType());
    }

    const std::string& path() const { return path_; }

    std::tuple<int, int> getDimensions() const {
        return std::make_tuple(width_, height_);
    }

    int bandCount() const { return dataset_->GetRasterCount(); }

    int colorDepthBits() const { return color_depth_bits_; }

    std::tuple<double, double> getPixelSize() const {
        return std::make_tuple(pixel_width_, pixel_height_);
    }

    SourceRaster read() const
    {
        if (bandCount() > 1) {
            std::cerr << "Warning: '" << path_ << "' has " << bandCount()
                      << " bands, only band 1 is used" << std::endl;
        }

        std::vector<double> samples(static_cast<size_t>(width_) * height_);

        GDALRasterBand* band = dataset_->GetRasterBand(1);
        CPLErr err = band->RasterIO(GF_Read, 0, 0, width_, height_,
                                    samples.data(), width_, height_,
                                    GDT_Float64, 0, 0);
        if (err != CE_None) {
            throw SourceOpenError("raster source",
                "failed to read band 1 of '" + path_ + "': " +
                detail::lastGdalError("read error"));
        }

        // Nodata cells become NaN so no stage counts them as values
        int has_nodata = 0;
        const double nodata_value = band->GetNoDataValue(&has_nodata);
        if (has_nodata) {
            for (double& value : samples) {
                if (value == nodata_value) {
                    value = std::numeric_limits<double>::quiet_NaN();
                }
            }
        }

        Raster raster(width_, height_, std::move(samples),
                      pixel_width_, pixel_height_, color_depth_bits_);

        ValueRange range = analyzeRange(raster);
        double step = colorStepDistance(range, color_depth_bits_);

        return SourceRaster{path_, std::move(raster), step};
    }

private:
    std::string path_;
    detail::DatasetPtr dataset_;
    int width_ = 0;
    int height_ = 0;
    double geo_transform_[6] = {0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    double pixel_width_ = 0.0;
    double pixel_height_ = 0.0;
    int color_depth_bits_ = 0;
};

RasterSource::RasterSource(const std::string& path)
    : pImpl(std::make_unique<Impl>(path))
{
}

RasterSource::~RasterSource() = default;

const std::string& RasterSource::path() const
{
    return pImpl->path();
}

std::tuple<int, int> RasterSource::getDimensions() const
{
    return pImpl->getDimensions();
}

int RasterSource::bandCount() const
{
    return pImpl->bandCount();
}

int RasterSource::colorDepthBits() const
{
    return pImpl->colorDepthBits();
}

std::tuple<double, double> RasterSource::getPixelSize() const
{
    return pImpl->getPixelSize();
}

SourceRaster RasterSource::read() const
{
    return pImpl->read();
}

SourceRaster loadRaster(const std::string& path)
{
    RasterSource source(path);
    return source.read();
}

} // namespace tiftool
