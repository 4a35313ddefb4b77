/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "tpl/tpl_document.h"
#include "tpl/tpl_options.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace ps::tpl {

enum class DecodeStatus {
    Ok,
    InvalidHeader,
    ToolSectionNotFound,
};

std::string_view decode_status_name(DecodeStatus status);

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Ok;
    Document document;

    bool ok() const { return status == DecodeStatus::Ok; }
};

class TplParser {
   public:
    static DecodeResult
    DecodeTplFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeTplBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    static nlohmann::ordered_json ToJson(const Document& document);
    static std::string Serialize(const Document& document);
};

}  // namespace ps::tpl
