/**
 * @file test_resampler.cpp
 * @brief Tests for resize factor computation and resampling
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "tiftool/errors.hpp"
#include "tiftool/resampler.hpp"
#include "test_support.hpp"

#include <tuple>
#include <vector>

using namespace tiftool;
using tiftool::test::linearRamp;
using tiftool::test::makeRaster;

TEST_CASE("Resize factors from pixel sizes", "[Resampler]") {
    ResizeFactors factors = computeResizeFactors(2.0, 2.0, 1.0);
    REQUIRE(factors.fx == Approx(2.0));
    REQUIRE(factors.fy == Approx(2.0));

    factors = computeResizeFactors(0.5, 2.0, 4.0);
    REQUIRE(factors.fx == Approx(0.125));
    REQUIRE(factors.fy == Approx(0.5));
}

TEST_CASE("Resize factors reject a non-positive target", "[Resampler]") {
    REQUIRE_THROWS_AS(computeResizeFactors(1.0, 1.0, 0.0), InvalidParameterError);
    REQUIRE_THROWS_AS(computeResizeFactors(1.0, 1.0, -2.5), InvalidParameterError);
}

TEST_CASE("Resized dimensions are truncated", "[Resampler]") {
    int width = 0;
    int height = 0;

    std::tie(width, height) = resizedDimensions(100, 50, ResizeFactors{2.0, 2.0});
    REQUIRE(width == 200);
    REQUIRE(height == 100);

    std::tie(width, height) = resizedDimensions(10, 7, ResizeFactors{0.35, 0.35});
    REQUIRE(width == 3);
    REQUIRE(height == 2);

    std::tie(width, height) = resizedDimensions(9, 9, ResizeFactors{0.99, 1.99});
    REQUIRE(width == 8);
    REQUIRE(height == 17);
}

TEST_CASE("Resizing to an empty image is rejected", "[Resampler]") {
    REQUIRE_THROWS_AS(resizedDimensions(3, 3, ResizeFactors{0.2, 1.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(resizedDimensions(3, 3, ResizeFactors{1.0, 0.2}), InvalidParameterError);

    Raster raster = makeRaster(4, 4, linearRamp(16, 0.0, 15.0));
    REQUIRE_THROWS_AS(resize(raster, ResizeFactors{0.1, 0.1}), InvalidParameterError);
}

TEST_CASE("Upsampling doubles the pixel grid", "[Resampler]") {
    std::vector<double> values = linearRamp(100 * 50, 0.0, 499.0);
    Raster raster = makeRaster(100, 50, values, 2.0);

    ResizeFactors factors = computeResizeFactors(2.0, 2.0, 1.0);
    Raster resized = resize(raster, factors);

    REQUIRE(resized.width() == 200);
    REQUIRE(resized.height() == 100);
    REQUIRE(resized.pixelWidth() == Approx(1.0));
    REQUIRE(resized.pixelHeight() == Approx(1.0));
    REQUIRE(resized.colorDepthBits() == raster.colorDepthBits());

    // The source is left as it was
    REQUIRE(raster.width() == 100);
    REQUIRE(raster.samples() == values);
}

TEST_CASE("Downsampling averages blocks", "[Resampler]") {
    // 0/2 checkerboard, every 2x2 block averages to 1
    std::vector<double> values(8 * 8);
    for (int y = 0; y < 8; y++) {
        for (int x = 0; x < 8; x++) {
            values[y * 8 + x] = ((x + y) % 2 == 0) ? 0.0 : 2.0;
        }
    }
    Raster raster = makeRaster(8, 8, values, 1.0);

    Raster resized = resize(raster, computeResizeFactors(1.0, 1.0, 2.0));

    REQUIRE(resized.width() == 4);
    REQUIRE(resized.height() == 4);
    REQUIRE(resized.pixelWidth() == Approx(2.0));
    for (double value : resized.samples()) {
        REQUIRE(value == Approx(1.0));
    }
}

TEST_CASE("Constant rasters stay constant when enlarged or shrunk", "[Resampler]") {
    Raster raster = makeRaster(6, 6, std::vector<double>(36, 812.25));

    Raster larger = resize(raster, ResizeFactors{1.5, 1.5});
    REQUIRE(larger.width() == 9);
    for (double value : larger.samples()) {
        REQUIRE(value == Approx(812.25));
    }

    Raster smaller = resize(raster, ResizeFactors{0.5, 0.5});
    REQUIRE(smaller.width() == 3);
    for (double value : smaller.samples()) {
        REQUIRE(value == Approx(812.25));
    }
}

TEST_CASE("Anisotropic pixels become square", "[Resampler]") {
    Raster raster(10, 10, linearRamp(100, 0.0, 99.0), 2.0, 4.0, 32);

    Raster resized = resize(raster, computeResizeFactors(2.0, 4.0, 1.0));

    REQUIRE(resized.width() == 20);
    REQUIRE(resized.height() == 40);
    REQUIRE(resized.pixelWidth() == Approx(1.0));
    REQUIRE(resized.pixelHeight() == Approx(1.0));
    REQUIRE(resized.colorDepthBits() == 32);
}
