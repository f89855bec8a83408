/**
 * @file error.hpp
 * @brief bitcodec error handling.
 *
 * Provides both error codes (for operations whose failure is a normal
 * outcome, such as writing to a sink) and exceptions (for contract
 * violations that must stop the caller).
 */

#ifndef BITCODEC_ERROR_HPP
#define BITCODEC_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace bitcodec {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    Unsupported = -2, ///< Operation not implemented by the codec
    IoError = -3      ///< Byte sink rejected the data
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Unsupported:
        return "Unsupported operation";
    case Error::IoError:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for bitcodec errors.
 */
class BitCodecException : public std::runtime_error {
public:
    explicit BitCodecException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public BitCodecException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitCodecException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for operations the codec deliberately does not provide.
 */
class UnsupportedOperationException : public BitCodecException {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : BitCodecException(message, Error::Unsupported) {}
};

} // namespace bitcodec

#endif // BITCODEC_ERROR_HPP
