/**
 * @file error.cpp
 * @brief Error code names
 */

#include "canonjson/common.hpp"

namespace canonjson {

std::string_view to_string(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidNumber:
            return "InvalidNumber";
        case ErrorCode::kDuplicateKey:
            return "DuplicateKey";
        case ErrorCode::kUnsupportedType:
            return "UnsupportedType";
        case ErrorCode::kDepthExceeded:
            return "DepthExceeded";
        case ErrorCode::kInvalidString:
            return "InvalidString";
        case ErrorCode::kUnsupportedAlgorithm:
            return "UnsupportedAlgorithm";
        case ErrorCode::kParseError:
            return "ParseError";
        case ErrorCode::kIoError:
            return "IOError";
        case ErrorCode::kInvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

}  // namespace canonjson
