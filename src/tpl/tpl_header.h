/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ps::tpl {

constexpr std::string_view kTplSignature = "8btp";
constexpr std::string_view kPhotoshopSignature = "8bim";
constexpr std::string_view kToolSectionMarker = "8BIMtptp";
constexpr std::size_t kHeaderReservedBytes = 8;
constexpr std::size_t kToolSectionSkip = 16;

struct HeaderCheck {
    bool valid = false;
    std::size_t offset = 0;
};

struct SectionLocation {
    bool found = false;
    std::size_t offset = 0;
};

HeaderCheck validate_header(std::span<const std::uint8_t> bytes);

// Only the last marker counts: earlier ones belong to embedded metadata.
SectionLocation locate_tool_section(std::span<const std::uint8_t> bytes);

}  // namespace ps::tpl
