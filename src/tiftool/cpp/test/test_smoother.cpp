/**
 * @file test_smoother.cpp
 * @brief Tests for Gaussian smoothing
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "tiftool/errors.hpp"
#include "tiftool/smoother.hpp"
#include "test_support.hpp"

#include <numeric>
#include <vector>

using namespace tiftool;
using tiftool::test::linearRamp;
using tiftool::test::makeRaster;

TEST_CASE("Kernel size must be positive and odd", "[Smoother]") {
    Raster raster = makeRaster(4, 4, linearRamp(16, 0.0, 1.0));

    REQUIRE_THROWS_AS(blur(raster, BlurSettings{4, 1.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(blur(raster, BlurSettings{0, 1.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(blur(raster, BlurSettings{-3, 1.0}), InvalidParameterError);
    REQUIRE_NOTHROW(validate(BlurSettings{3, 1.0}));
    REQUIRE_NOTHROW(validate(BlurSettings{9, 0.0}));
}

TEST_CASE("Small kernels use the fixed tables", "[Smoother]") {
    REQUIRE(gaussianKernel(1, 0.0) == std::vector<double>{1.0});
    REQUIRE(gaussianKernel(3, 0.0) == std::vector<double>{0.25, 0.5, 0.25});
    REQUIRE(gaussianKernel(5, -1.0) ==
            std::vector<double>{0.0625, 0.25, 0.375, 0.25, 0.0625});
    REQUIRE(gaussianKernel(7, 0.0).size() == 7);
}

TEST_CASE("Computed kernels are normalized and symmetric", "[Smoother]") {
    for (int size : {3, 9, 15}) {
        for (double sigma : {0.0, 0.7, 2.0}) {
            std::vector<double> kernel = gaussianKernel(size, sigma);
            REQUIRE(kernel.size() == static_cast<size_t>(size));
            REQUIRE(std::accumulate(kernel.begin(), kernel.end(), 0.0) == Approx(1.0));
            for (int i = 0; i < size / 2; i++) {
                REQUIRE(kernel[i] == Approx(kernel[size - 1 - i]));
                REQUIRE(kernel[i] < kernel[i + 1]);
            }
        }
    }
}

TEST_CASE("Sigma is derived from the kernel size when not positive", "[Smoother]") {
    REQUIRE(effectiveSigma(BlurSettings{5, 0.0}) == Approx(1.1));
    REQUIRE(effectiveSigma(BlurSettings{9, -2.0}) == Approx(1.7));
    REQUIRE(effectiveSigma(BlurSettings{9, 2.5}) == Approx(2.5));
}

TEST_CASE("Blurring an impulse spreads it by the kernel", "[Smoother]") {
    std::vector<double> values(25, 0.0);
    values[2 * 5 + 2] = 1.0;
    Raster raster = makeRaster(5, 5, values);

    Raster blurred = blur(raster, BlurSettings{3, 0.0});

    REQUIRE(blurred.at(2, 2) == Approx(0.25));
    REQUIRE(blurred.at(1, 2) == Approx(0.125));
    REQUIRE(blurred.at(2, 3) == Approx(0.125));
    REQUIRE(blurred.at(1, 1) == Approx(0.0625));
    REQUIRE(blurred.at(0, 0) == Approx(0.0));

    const std::vector<double>& samples = blurred.samples();
    REQUIRE(std::accumulate(samples.begin(), samples.end(), 0.0) == Approx(1.0));

    // The input keeps its impulse
    REQUIRE(raster.at(2, 2) == 1.0);
}

TEST_CASE("Borders are mirrored without repeating the edge", "[Smoother]") {
    Raster raster = makeRaster(5, 1, {0.0, 0.0, 0.0, 0.0, 1.0});

    Raster blurred = blur(raster, BlurSettings{3, 0.0});

    REQUIRE(blurred.at(4, 0) == Approx(0.5));
    REQUIRE(blurred.at(3, 0) == Approx(0.25));
    REQUIRE(blurred.at(2, 0) == Approx(0.0));
}

TEST_CASE("Blur keeps constant rasters and geometry", "[Smoother]") {
    Raster raster(7, 3, std::vector<double>(21, 42.0), 0.5, 0.25, 32);

    Raster blurred = blur(raster, BlurSettings{11, 3.0});

    REQUIRE(blurred.width() == 7);
    REQUIRE(blurred.height() == 3);
    REQUIRE(blurred.pixelWidth() == Approx(0.5));
    REQUIRE(blurred.pixelHeight() == Approx(0.25));
    REQUIRE(blurred.colorDepthBits() == 32);
    for (double value : blurred.samples()) {
        REQUIRE(value == Approx(42.0));
    }
}

TEST_CASE("A single-tap kernel leaves the raster unchanged", "[Smoother]") {
    std::vector<double> values = linearRamp(12, -3.0, 8.0);
    Raster raster = makeRaster(4, 3, values);

    Raster blurred = blur(raster, BlurSettings{1, 0.0});

    for (size_t i = 0; i < values.size(); i++) {
        REQUIRE(blurred.samples()[i] == Approx(values[i]));
    }
}
