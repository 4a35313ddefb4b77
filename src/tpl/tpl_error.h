/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ps::tpl {

enum class DecodeErrorKind {
    UnexpectedEndOfBuffer,
    UnrecoverablePlaceholderScan,
    MaxDepthExceeded,
};

std::string_view error_kind_name(DecodeErrorKind kind);

// Raised for malformed tool data. Header and section failures are reported
// through DecodeStatus instead.
class DecodeError : public std::runtime_error {
   public:
    DecodeError(DecodeErrorKind kind, std::size_t offset, const std::string& what);

    DecodeErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }

   private:
    DecodeErrorKind _kind;
    std::size_t _offset;
};

}  // namespace ps::tpl
