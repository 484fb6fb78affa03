#pragma once

#include "passcheck/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the passcheck library
 */

namespace passcheck {
namespace core {

/**
 * @brief Base exception class for all passcheck exceptions
 *
 * Carries a result code, the bare message and optional context
 * (usually the throw site).
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    /**
     * @brief Get the result code
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
     */
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Malformed or empty image handed to a check or the pipeline
 */
class InvalidInputException : public Exception {
public:
    InvalidInputException(const std::string& message,
                          const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_INPUT, message, context) {}
};

/**
 * @brief Out-of-range threshold, confidence or parameter
 */
class InvalidArgumentException : public Exception {
public:
    InvalidArgumentException(const std::string& message,
                             const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_ARGUMENT, message, context) {}
};

/**
 * @brief Configuration file errors
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIGURATION, message, context) {}
};

/**
 * @brief Detection model errors (loading, use after release)
 */
class ModelException : public Exception {
public:
    ModelException(ResultCode code,
                   const std::string& message,
                   const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define PASSCHECK_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define PASSCHECK_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace passcheck
