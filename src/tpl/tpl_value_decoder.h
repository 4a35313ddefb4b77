/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "tpl_byte_reader.h"
#include "tpl_document.h"
#include "tpl_options.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ps::tpl {

// Result of one tag dispatch. The name differs from the requested one when the
// placeholder scan folded skipped bytes into it.
struct NamedValue {
    std::string name;
    TypedValue typed;
};

// Decodes action-descriptor style properties ("name" label, 4-byte tag, payload)
// from a ByteReader. Objc and VlLs payloads recurse back into extract_property
// and read_tagged_value.
class DescriptorDecoder {
   public:
    explicit DescriptorDecoder(ByteReader& reader, ParserDecodeOptions options = {});

    std::span<const std::uint8_t> extract_label();
    Property extract_property();
    PropertyList extract_object_class(std::string_view name);
    ValueList extract_list();
    std::string extract_text();
    EnumValue extract_enum();
    UnitFloat extract_unit_float();

    // Empty for the recognized-but-unsupported tags; the reader is left where
    // the tag ended.
    std::optional<NamedValue> read_tagged_value(std::string name, std::string tag);

    std::size_t depth() const { return _depth; }

   private:
    class DepthScope {
       public:
        explicit DepthScope(DescriptorDecoder& owner);
        ~DepthScope();
        DepthScope(const DepthScope&) = delete;
        DepthScope& operator=(const DepthScope&) = delete;

       private:
        DescriptorDecoder& _owner;
    };

    std::string read_tag();
    void scan_placeholder(std::string& name, std::string& tag);

    ByteReader& _reader;
    ParserDecodeOptions _options;
    std::size_t _depth = 0;
};

// Photoshop stores identifiers as 7-bit text; the high bit of every byte is cleared.
std::string ascii_string(std::span<const std::uint8_t> bytes);
std::string trim_ascii(std::string_view s);
std::size_t count_hex_zero_pairs(std::span<const std::uint8_t> bytes);

}  // namespace ps::tpl
