/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_header.h"

#include <algorithm>

namespace ps::tpl {

static bool equals_ignore_case(std::span<const std::uint8_t> bytes, std::string_view expected) {
    if (bytes.size() != expected.size()) {
        return false;
    }
    for (std::size_t i = 0; i < bytes.size(); i++) {
        unsigned char c = static_cast<unsigned char>(bytes[i] & 0x7Fu);
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<unsigned char>(c + 32);
        }
        if (c != static_cast<unsigned char>(expected[i])) {
            return false;
        }
    }
    return true;
}

HeaderCheck validate_header(std::span<const std::uint8_t> bytes) {
    HeaderCheck out{};
    std::size_t off = 0;
    if (bytes.size() < kTplSignature.size()
        || !equals_ignore_case(bytes.subspan(off, kTplSignature.size()), kTplSignature)) {
        return out;
    }
    off += kTplSignature.size() + kHeaderReservedBytes;

    if (bytes.size() < off + kPhotoshopSignature.size()
        || !equals_ignore_case(bytes.subspan(off, kPhotoshopSignature.size()), kPhotoshopSignature)) {
        return out;
    }
    off += kPhotoshopSignature.size();

    out.valid = true;
    out.offset = off;
    return out;
}

SectionLocation locate_tool_section(std::span<const std::uint8_t> bytes) {
    SectionLocation out{};
    const auto it = std::find_end(
        bytes.begin(), bytes.end(), kToolSectionMarker.begin(), kToolSectionMarker.end(),
        [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); }
    );
    if (it == bytes.end()) {
        return out;
    }
    out.found = true;
    out.offset = static_cast<std::size_t>(it - bytes.begin()) + kToolSectionSkip;
    return out;
}

}  // namespace ps::tpl
