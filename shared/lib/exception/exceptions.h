/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types for the person UUID codec.
 * Every exception carries an ErrorCode so callers can map failures
 * to input-validation responses without string matching.
 *
 * @author SmartCore Inc.
 * @date 2026-10-18
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/// @brief Error taxonomy shared by all person UUID failures
enum class ErrorCode {
    MALFORMED_NUMBER,       ///< Number or serial outside the representable range
    CHECKSUM_MISMATCH,      ///< Final digit does not match the Luhn check digit
    INVALID_DATE,           ///< Embedded birth date is not a Gregorian date
    UNCLASSIFIABLE_NUMBER,  ///< Digit pattern matches no known identity type
    NON_CONFORMANT_BINARY,  ///< 128-bit value does not follow the reserved layout
    UNPARSABLE_TEXT,        ///< Text matches none of the accepted shapes
    CONFIG                  ///< Invalid configuration value
};

/// @brief Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_NUMBER:      return "MALFORMED_NUMBER";
        case ErrorCode::CHECKSUM_MISMATCH:     return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATE:          return "INVALID_DATE";
        case ErrorCode::UNCLASSIFIABLE_NUMBER: return "UNCLASSIFIABLE_NUMBER";
        case ErrorCode::NON_CONFORMANT_BINARY: return "NON_CONFORMANT_BINARY";
        case ErrorCode::UNPARSABLE_TEXT:       return "UNPARSABLE_TEXT";
        case ErrorCode::CONFIG:                return "CONFIG";
    }
    return "UNKNOWN";
}

/**
 * @brief Base exception for all person UUID exceptions
 */
class PersonUuidException : public std::runtime_error {
private:
    ErrorCode code_;

public:
    PersonUuidException(ErrorCode code, const std::string& message)
        : std::runtime_error(message),
          code_(code) {}

    /**
     * @brief Get the error code
     */
    [[nodiscard]] ErrorCode getCode() const noexcept {
        return code_;
    }
};

/**
 * @brief Number or serial out of range
 */
class MalformedNumberException : public PersonUuidException {
public:
    explicit MalformedNumberException(const std::string& message)
        : PersonUuidException(ErrorCode::MALFORMED_NUMBER, "Malformed number: " + message) {}
};

/**
 * @brief Check digit mismatch
 */
class ChecksumMismatchException : public PersonUuidException {
public:
    explicit ChecksumMismatchException(const std::string& message)
        : PersonUuidException(ErrorCode::CHECKSUM_MISMATCH, "Checksum mismatch: " + message) {}
};

/**
 * @brief Embedded date is not a real calendar date
 */
class InvalidDateException : public PersonUuidException {
public:
    explicit InvalidDateException(const std::string& message)
        : PersonUuidException(ErrorCode::INVALID_DATE, "Invalid date: " + message) {}
};

/**
 * @brief Number matches none of the identity categories
 */
class UnclassifiableNumberException : public PersonUuidException {
public:
    explicit UnclassifiableNumberException(const std::string& message)
        : PersonUuidException(ErrorCode::UNCLASSIFIABLE_NUMBER, "Unclassifiable number: " + message) {}
};

/**
 * @brief 128-bit value is not a person UUID
 */
class NonConformantBinaryException : public PersonUuidException {
public:
    explicit NonConformantBinaryException(const std::string& message)
        : PersonUuidException(ErrorCode::NON_CONFORMANT_BINARY, "Non-conformant UUID: " + message) {}
};

/**
 * @brief Parsing error (identity number text or UUID text)
 */
class UnparsableTextException : public PersonUuidException {
public:
    explicit UnparsableTextException(const std::string& message)
        : PersonUuidException(ErrorCode::UNPARSABLE_TEXT, "Parsing error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public PersonUuidException {
public:
    explicit ConfigException(const std::string& message)
        : PersonUuidException(ErrorCode::CONFIG, "Configuration error: " + message) {}
};

} // namespace common
