/**
 * @file smoother.cpp
 * @brief Implementation of separable Gaussian smoothing
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "tiftool/smoother.hpp"
#include "tiftool/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace tiftool {

namespace {

constexpr int SMALL_KERNEL_MAX_SIZE = 7;

const double SMALL_KERNELS[][SMALL_KERNEL_MAX_SIZE] = {
    {1.0},
    {0.25, 0.5, 0.25},
    {0.0625, 0.25, 0.375, 0.25, 0.0625},
    {0.03125, 0.109375, 0.21875, 0.28125, 0.21875, 0.109375, 0.03125}
};

// Mirror an out-of-range index back into [0, length) without repeating the edge
int reflectIndex(int index, int length)
{
    if (length == 1) {
        return 0;
    }
    while (index < 0 || index >= length) {
        if (index < 0) {
            index = -index;
        } else {
            index = 2 * (length - 1) - index;
        }
    }
    return index;
}

std::vector<double> convolveRows(const std::vector<double>& src, int width, int height,
                                 const std::vector<double>& kernel)
{
    const int radius = static_cast<int>(kernel.size()) / 2;
    std::vector<double> dst(src.size(), 0.0);

    for (int y = 0; y < height; y++) {
        const double* row = &src[static_cast<size_t>(y) * width];
        double* out = &dst[static_cast<size_t>(y) * width];
        for (int x = 0; x < width; x++) {
            double sum = 0.0;
            for (int k = -radius; k <= radius; k++) {
                sum += row[reflectIndex(x + k, width)] * kernel[k + radius];
            }
            out[x] = sum;
        }
    }
    return dst;
}

std::vector<double> convolveColumns(const std::vector<double>& src, int width, int height,
                                    const std::vector<double>& kernel)
{
    const int radius = static_cast<int>(kernel.size()) / 2;
    std::vector<double> dst(src.size(), 0.0);

    for (int y = 0; y < height; y++) {
        double* out = &dst[static_cast<size_t>(y) * width];
        for (int k = -radius; k <= radius; k++) {
            const double weight = kernel[k + radius];
            const double* row = &src[static_cast<size_t>(reflectIndex(y + k, height)) * width];
            for (int x = 0; x < width; x++) {
                out[x] += row[x] * weight;
            }
        }
    }
    return dst;
}

} // namespace

void validate(const BlurSettings& settings)
{
    if (settings.kernel_size <= 0 || settings.kernel_size % 2 == 0) {
        throw InvalidParameterError("gaussian blur",
            "kernel size must be a positive odd number, got " +
            std::to_string(settings.kernel_size));
    }
    if (std::isnan(settings.sigma) || std::isinf(settings.sigma)) {
        throw InvalidParameterError("gaussian blur", "sigma must be finite");
    }
}

double effectiveSigma(const BlurSettings& settings)
{
    if (settings.sigma > 0.0) {
        return settings.sigma;
    }
    return 0.3 * ((settings.kernel_size - 1) * 0.5 - 1.0) + 0.8;
}

std::vector<double> gaussianKernel(int kernel_size, double sigma)
{
    BlurSettings settings;
    settings.kernel_size = kernel_size;
    settings.sigma = sigma;
    validate(settings);

    if (sigma <= 0.0 && kernel_size <= SMALL_KERNEL_MAX_SIZE) {
        const double* table = SMALL_KERNELS[kernel_size / 2];
        return std::vector<double>(table, table + kernel_size);
    }

    const double s = effectiveSigma(settings);
    const double scale = -0.5 / (s * s);
    const int radius = kernel_size / 2;

    std::vector<double> kernel(kernel_size);
    double sum = 0.0;
    for (int i = 0; i < kernel_size; i++) {
        double x = i - radius;
        kernel[i] = std::exp(scale * x * x);
        sum += kernel[i];
    }

    for (double& weight : kernel) {
        weight /= sum;
    }
    return kernel;
}

Raster blur(const Raster& raster, const BlurSettings& settings)
{
    std::vector<double> kernel = gaussianKernel(settings.kernel_size, settings.sigma);

    std::vector<double> horizontal = convolveRows(raster.samples(), raster.width(),
                                                  raster.height(), kernel);
    std::vector<double> blurred = convolveColumns(horizontal, raster.width(),
                                                  raster.height(), kernel);

    return Raster(raster.width(), raster.height(), std::move(blurred),
                  raster.pixelWidth(), raster.pixelHeight(), raster.colorDepthBits());
}

} // namespace tiftool
