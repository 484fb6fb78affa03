#pragma once

/**
 * @file passcheck.h
 * @brief Main header for the passcheck photo compliance library
 *
 * Include this single header to access the data model, the landmark
 * provider, the nine compliance checks and the validation pipeline.
 */

// Core types and utilities
#include "passcheck/core/types.hpp"
#include "passcheck/core/exception.h"
#include "passcheck/core/Logger.hpp"

// Data model and face landmarks
#include "passcheck/model/PhotoRecord.hpp"
#include "passcheck/face/FaceTypes.hpp"
#include "passcheck/face/LandmarkProvider.hpp"
#include "passcheck/face/LandmarkExtractor.hpp"

// Checks
#include "passcheck/checks/CheckConfig.hpp"
#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/BrightnessCheck.hpp"
#include "passcheck/checks/SharpnessCheck.hpp"
#include "passcheck/checks/FacePositionCheck.hpp"
#include "passcheck/checks/ExpressionCheck.hpp"
#include "passcheck/checks/EyeVisibilityCheck.hpp"
#include "passcheck/checks/ReflectionCheck.hpp"
#include "passcheck/checks/ShadowCheck.hpp"
#include "passcheck/checks/HeadwearCheck.hpp"
#include "passcheck/checks/BackgroundCheck.hpp"

// Orchestration
#include "passcheck/validation/ValidationObserver.hpp"
#include "passcheck/validation/ValidationPipeline.hpp"
#include "passcheck/validation/ValidationReport.hpp"

namespace passcheck {

/**
 * @brief Library version string
 */
inline std::string getVersionString() {
    return "1.0.0";
}

/**
 * @brief Initialize global logging
 *
 * Optional. Without it the logger writes INFO and above to the console.
 *
 * @param log_level Minimum log level
 * @param log_directory Directory for a timestamped log file (empty = console only)
 * @return ResultCode indicating success or failure
 */
inline core::ResultCode initialize(core::LogLevel log_level = core::LogLevel::INFO,
                                   const std::string& log_directory = "") {
    auto& logger = core::Logger::getInstance();
    logger.setLevel(log_level);
    if (!log_directory.empty() && !logger.initializeWithTimestamp(log_directory, log_level)) {
        return core::ResultCode::ERROR_FILE_IO;
    }
    PASSCHECK_LOG_INFO("API") << "passcheck initialized - Version " << getVersionString();
    return core::ResultCode::SUCCESS;
}

/**
 * @brief Flush logs before exit
 */
inline void shutdown() {
    PASSCHECK_LOG_INFO("API") << "passcheck shutdown";
    core::Logger::getInstance().flush();
}

} // namespace passcheck
