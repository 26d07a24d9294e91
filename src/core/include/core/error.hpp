#pragma once

#include "core/expected.hpp"
#include <string>

namespace ac {

/**
 * @brief Failure categories reported by the processing core
 *
 * UnsupportedFormat and CorruptData are raised while decoding input
 * (together they form the decode error family). The remaining kinds are
 * raised by analysis, reduction and conversion.
 */
enum class ErrorKind {
    UnsupportedFormat,  ///< Container/codec cannot be parsed or produced
    CorruptData,        ///< Headers parse but sample data is truncated/invalid
    EmptyInput,         ///< Zero-length buffer where signal is required
    InvalidOptions,     ///< Out-of-range reduction options
    InvalidParameter,   ///< Out-of-range or unsupported conversion/encode parameter
    ProcessingError     ///< Stage-internal numeric failure (indicates a defect)
};

struct Error {
    ErrorKind kind = ErrorKind::ProcessingError;
    std::string message;
};

template <class T>
using Result = expected<T, Error>;

/// Stable identifier for the service layer ("unsupported_format", ...)
const char* to_string(ErrorKind kind) noexcept;

inline bool is_decode_error(ErrorKind kind) noexcept {
    return kind == ErrorKind::UnsupportedFormat || kind == ErrorKind::CorruptData;
}

inline unexpected<Error> fail(ErrorKind kind, std::string message) {
    return unexpected<Error>(Error{kind, std::move(message)});
}

/// "kind: message" for logging
std::string describe(const Error& error);

} // namespace ac
