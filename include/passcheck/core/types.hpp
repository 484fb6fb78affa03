#pragma once

#include <cstdint>
#include <chrono>
#include <string>

/**
 * @file types.hpp
 * @brief Common type definitions for the passcheck library
 */

namespace passcheck {
namespace core {

/**
 * @brief Result codes shared by all passcheck modules
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_INVALID_INPUT = -2,       ///< Malformed or empty image
    ERROR_INVALID_ARGUMENT = -3,    ///< Out-of-range threshold or confidence
    ERROR_NOT_INITIALIZED = -4,
    ERROR_CONFIGURATION = -5,       ///< Unreadable or malformed configuration
    ERROR_MODEL_LOAD = -6,          ///< Detection model could not be loaded
    ERROR_FILE_IO = -8,
    ERROR_CHECK_FAILURE = -9        ///< Unexpected failure inside a check
};

/**
 * @brief Wall-clock time point used for photo timestamps
 */
using Timestamp = std::chrono::system_clock::time_point;

} // namespace core
} // namespace passcheck
