/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_error.h"

namespace ps::tpl {

std::string_view error_kind_name(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::UnexpectedEndOfBuffer:
            return "UnexpectedEndOfBuffer";
        case DecodeErrorKind::UnrecoverablePlaceholderScan:
            return "UnrecoverablePlaceholderScan";
        case DecodeErrorKind::MaxDepthExceeded:
            return "MaxDepthExceeded";
    }
    return "Unknown";
}

static std::string format_message(DecodeErrorKind kind, std::size_t offset, const std::string& what) {
    return std::string(error_kind_name(kind)) + " at offset " + std::to_string(offset) + ": " + what;
}

DecodeError::DecodeError(DecodeErrorKind kind, std::size_t offset, const std::string& what)
    : std::runtime_error(format_message(kind, offset, what)), _kind(kind), _offset(offset) {}

}  // namespace ps::tpl
