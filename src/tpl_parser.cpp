/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl_parser.h"

#include "tpl/tpl_byte_reader.h"
#include "tpl/tpl_header.h"
#include "tpl/tpl_json.h"
#include "tpl/tpl_tool_reader.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>

namespace ps::tpl {

std::string_view decode_status_name(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:
            return "Ok";
        case DecodeStatus::InvalidHeader:
            return "InvalidHeader";
        case DecodeStatus::ToolSectionNotFound:
            return "ToolSectionNotFound";
    }
    return "Unknown";
}

DecodeResult
TplParser::DecodeTplFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = ps::fs_utils::read_file(path);
    return DecodeTplBytes(bytes, opt, path.filename().string());
}

DecodeResult TplParser::DecodeTplBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    DecodeResult result{};
    const auto t0 = std::chrono::steady_clock::now();

    const HeaderCheck header = validate_header(bytes);
    if (!header.valid) {
        result.status = DecodeStatus::InvalidHeader;
        if (opt.debug) {
            PS_LOG_INFO("Decode %s: invalid header", std::string(label).c_str());
        }
        return result;
    }

    const SectionLocation section = locate_tool_section(bytes);
    if (!section.found) {
        result.status = DecodeStatus::ToolSectionNotFound;
        if (opt.debug) {
            PS_LOG_INFO("Decode %s: no tool section marker", std::string(label).c_str());
        }
        return result;
    }

    ByteReader reader(bytes, section.offset);
    result.document = read_tools(reader, opt);

    if (opt.debug) {
        const auto t1 = std::chrono::steady_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        PS_LOG_INFO(
            "Decode %s: bytes=%zu section=%zu types=%zu tools=%zu time=%lldms",
            std::string(label).c_str(), bytes.size(), section.offset, result.document.groups.size(),
            result.document.tool_count(), static_cast<long long>(ms)
        );
    }
    return result;
}

nlohmann::ordered_json TplParser::ToJson(const Document& document) {
    return document_to_json(document);
}

std::string TplParser::Serialize(const Document& document) {
    return document_to_json(document).dump(2);
}

}  // namespace ps::tpl
