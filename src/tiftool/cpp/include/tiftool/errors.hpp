/**
 * @file errors.hpp
 * @brief Exception types raised by the raster conversion pipeline
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef TIFTOOL_ERRORS_HPP
#define TIFTOOL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tiftool {

/**
 * @class Error
 * @brief Base class for all pipeline failures
 *
 * The message is prefixed with the name of the stage that failed so it can
 * be printed to the user as-is.
 */
class Error : public std::runtime_error {
public:
    Error(const std::string& stage, const std::string& message)
        : std::runtime_error(stage + ": " + message), stage_(stage) {}

    /**
     * @brief Name of the pipeline stage that raised the error
     */
    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

/**
 * @class SourceOpenError
 * @brief The input raster is missing, unreadable, or has no usable band
 */
class SourceOpenError : public Error {
public:
    using Error::Error;
};

/**
 * @class InvalidParameterError
 * @brief A user-supplied or derived parameter is out of range
 */
class InvalidParameterError : public Error {
public:
    using Error::Error;
};

/**
 * @class DegenerateRangeError
 * @brief The raster has no value spread to normalize over
 */
class DegenerateRangeError : public Error {
public:
    using Error::Error;
};

/**
 * @class SinkWriteError
 * @brief The output image could not be written
 */
class SinkWriteError : public Error {
public:
    using Error::Error;
};

} // namespace tiftool

#endif // TIFTOOL_ERRORS_HPP
