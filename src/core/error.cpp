#include "pluscode/error.hpp"

namespace pluscode {

const char* error_name(ErrorCode error) {
    switch (error) {
        case ErrorCode::InvalidCode:
            return "invalid_code";
        case ErrorCode::FullCodeExpected:
            return "full_code_expected";
        case ErrorCode::CannotShortenPaddedCodes:
            return "cannot_shorten_padded_codes";
        case ErrorCode::CodeLengthTooSmall:
            return "code_length_too_small";
        case ErrorCode::InvalidCodeLength:
            return "invalid_open_location_code_length";
    }
    return "unknown_error";
}

} // namespace pluscode
