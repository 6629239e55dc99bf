/**
 * @file types.hpp
 * @brief Common type definitions for the handcal library
 *
 * Result codes shared by the exception hierarchy and by the non-throwing
 * per-frame APIs that report failure through return values.
 */

#ifndef HANDCAL_CORE_TYPES_HPP
#define HANDCAL_CORE_TYPES_HPP

namespace handcal {
namespace core {

/**
 * @brief Result codes for library operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_NOT_INITIALIZED = -3,
    ERROR_ALREADY_INITIALIZED = -4,
    ERROR_CALIBRATION_INVALID = -5,
    ERROR_INSUFFICIENT_DATA = -6,
    ERROR_FILE_NOT_FOUND = -7,
    ERROR_FILE_IO = -8
};

} // namespace core
} // namespace handcal

#endif // HANDCAL_CORE_TYPES_HPP
