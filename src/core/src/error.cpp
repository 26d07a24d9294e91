#include "core/error.hpp"

namespace ac {

const char* to_string(ErrorKind kind) noexcept {
    switch(kind) {
        case ErrorKind::UnsupportedFormat: return "unsupported_format";
        case ErrorKind::CorruptData: return "corrupt_data";
        case ErrorKind::EmptyInput: return "empty_input";
        case ErrorKind::InvalidOptions: return "invalid_options";
        case ErrorKind::InvalidParameter: return "invalid_parameter";
        case ErrorKind::ProcessingError: return "processing_error";
    }
    return "unknown";
}

std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace ac
