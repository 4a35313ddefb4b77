/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "tpl_byte_reader.h"
#include "tpl_document.h"
#include "tpl_value_decoder.h"

#include <string>
#include <string_view>

namespace ps::tpl {

constexpr std::size_t kToolNamePadding = 10;

// "Default=MyBrush" -> "MyBrush"
std::string tool_display_name(std::string_view raw_name);

// Reads tool records until fewer than 4 bytes remain. A section that starts
// with fewer than 4 bytes yields an empty document.
Document read_tools(ByteReader& reader, const ParserDecodeOptions& options = {});

}  // namespace ps::tpl
