/**
 * @file error.hpp
 * @brief bitcursor error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions). Library operations
 * return Error codes; applications may convert them with throw_if_error().
 */

#ifndef BITCURSOR_ERROR_HPP
#define BITCURSOR_ERROR_HPP

#include "config.hpp"

#if !BITCURSOR_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitcursor {

/**
 * @brief Error codes returned by all fallible operations.
 */
enum class Error {
    Ok = 0,               ///< Success
    InvalidArg = -1,      ///< Invalid argument
    InvalidBitRange = -2, ///< Bit request would cross a byte boundary
    Overflow = -3,        ///< Write past the end of the buffer
    Underflow = -4        ///< Read past the end of the buffer
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
    case Error::InvalidBitRange:
        return "Bit range crosses a byte boundary";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    default:
        return "Unknown error";
    }
}

#if !BITCURSOR_NO_EXCEPTIONS

/**
 * @brief Base exception for bitcursor errors.
 */
class BitCursorException : public std::runtime_error {
public:
    explicit BitCursorException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public BitCursorException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitCursorException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for bit requests spanning two bytes.
 */
class InvalidBitRangeException : public BitCursorException {
public:
    explicit InvalidBitRangeException(const std::string& message)
        : BitCursorException(message, Error::InvalidBitRange) {}
};

/**
 * @brief Exception for buffer overflow.
 */
class OverflowException : public BitCursorException {
public:
    explicit OverflowException(const std::string& message)
        : BitCursorException(message, Error::Overflow) {}
};

/**
 * @brief Exception for buffer underflow.
 */
class UnderflowException : public BitCursorException {
public:
    explicit UnderflowException(const std::string& message)
        : BitCursorException(message, Error::Underflow) {}
};

/**
 * @brief Throw the exception matching a non-Ok error code.
 *
 * @param error Error code returned by a library call
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const char* context) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = std::string(context) + ": " + error_string(error);
    switch (error) {
    case Error::InvalidBitRange:
        throw InvalidBitRangeException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::Underflow:
        throw UnderflowException(message);
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    default:
        throw BitCursorException(message, error);
    }
}

#endif // !BITCURSOR_NO_EXCEPTIONS

} // namespace bitcursor

#endif // BITCURSOR_ERROR_HPP
