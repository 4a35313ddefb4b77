/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_tool_reader.h"
#include "utils/log.h"

namespace ps::tpl {

std::string tool_display_name(std::string_view raw_name) {
    const auto pos = raw_name.rfind('=');
    if (pos == std::string_view::npos) {
        return std::string(raw_name);
    }
    return std::string(raw_name.substr(pos + 1));
}

Document read_tools(ByteReader& reader, const ParserDecodeOptions& options) {
    Document doc{};
    if (!reader.can_read(4)) {
        return doc;
    }

    DescriptorDecoder decoder(reader, options);
    do {
        const std::size_t record_start = reader.position();
        const std::string raw_name = decoder.extract_text();
        reader.skip(kToolNamePadding);
        const std::string type = trim_ascii(ascii_string(decoder.extract_label()));

        const std::uint32_t count = reader.read_u32_be();
        ToolRecord record{};
        record.name = tool_display_name(raw_name);
        for (std::uint32_t i = 0; i < count; i++) {
            record.properties.push_back(decoder.extract_property());
        }

        if (options.debug) {
            PS_LOG_INFO(
                "  tool '%s' type=%s properties=%u at %zu..%zu", record.name.c_str(), type.c_str(),
                count, record_start, reader.position()
            );
        }
        doc.tools_for(type).push_back(std::move(record));
    } while (reader.can_read(4));

    return doc;
}

}  // namespace ps::tpl
