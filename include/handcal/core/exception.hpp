#pragma once

#include "handcal/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.hpp
 * @brief Exception handling for the handcal library
 *
 * Exceptions are reserved for construction-time and configuration errors.
 * The per-frame tracking and calibration paths never throw; they report
 * failures through optional results and ResultCode values instead.
 */

namespace handcal {
namespace core {

/**
 * @brief Base exception class for all handcal exceptions
 *
 * Carries a result code, the raw message and optional context
 * (usually file:line from HANDCAL_THROW).
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

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

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
 * @brief Invalid tracking/calibration configuration or constructor argument
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Calibration data that cannot be used
 */
class CalibrationException : public Exception {
public:
    CalibrationException(const std::string& message,
                         const std::string& context = "")
        : Exception(ResultCode::ERROR_CALIBRATION_INVALID, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define HANDCAL_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace handcal
