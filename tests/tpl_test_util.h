/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace ps::tpl::test {

inline void append_u8(std::uint8_t v, std::vector<std::uint8_t>* out) {
    out->push_back(v);
}

inline void append_u16be(std::uint16_t v, std::vector<std::uint8_t>* out) {
    out->push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out->push_back(static_cast<std::uint8_t>(v & 0xFF));
}

inline void append_u32be(std::uint32_t v, std::vector<std::uint8_t>* out) {
    out->push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out->push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out->push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out->push_back(static_cast<std::uint8_t>(v & 0xFF));
}

inline void append_u64be(std::uint64_t v, std::vector<std::uint8_t>* out) {
    for (int i = 7; i >= 0; i--) {
        out->push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline void append_f64be(double v, std::vector<std::uint8_t>* out) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    append_u64be(bits, out);
}

inline void append_ascii(std::string_view s, std::vector<std::uint8_t>* out) {
    for (const char c : s) {
        out->push_back(static_cast<std::uint8_t>(c));
    }
}

// Length-prefixed label. Four-character ids use the zero-length short form.
inline void append_label(std::string_view s, std::vector<std::uint8_t>* out) {
    if (s.size() == 4) {
        append_u32be(0, out);
    } else {
        append_u32be(static_cast<std::uint32_t>(s.size()), out);
    }
    append_ascii(s, out);
}

// UTF-16BE text with a trailing NUL unit counted in the length.
inline void append_text(std::string_view s, std::vector<std::uint8_t>* out) {
    append_u32be(static_cast<std::uint32_t>(s.size() + 1), out);
    for (const char c : s) {
        append_u16be(static_cast<std::uint8_t>(c), out);
    }
    append_u16be(0, out);
}

inline void append_property_head(
    std::string_view name,
    std::string_view tag,
    std::vector<std::uint8_t>* out
) {
    append_label(name, out);
    append_ascii(tag, out);
}

inline void append_long_property(std::string_view name, std::uint32_t v, std::vector<std::uint8_t>* out) {
    append_property_head(name, "long", out);
    append_u32be(v, out);
}

inline void append_double_property(std::string_view name, double v, std::vector<std::uint8_t>* out) {
    append_property_head(name, "doub", out);
    append_f64be(v, out);
}

// Objc payload head: 6 reserved bytes, class label, property count.
inline void append_object_head(
    std::string_view class_id,
    std::uint32_t count,
    std::vector<std::uint8_t>* out
) {
    append_u32be(1, out);
    append_u16be(0, out);
    append_label(class_id, out);
    append_u32be(count, out);
}

inline void append_file_header(std::vector<std::uint8_t>* out) {
    append_ascii("8BTP", out);
    append_u16be(3, out);
    append_u16be(0, out);
    append_u32be(0, out);
    append_ascii("8BIM", out);
}

// Section marker plus the 8 length/type bytes the decoder skips.
inline void append_tool_section(std::vector<std::uint8_t>* out) {
    append_ascii("8BIMtptp", out);
    append_u32be(0, out);
    append_u32be(0, out);
}

inline void append_tool_head(
    std::string_view raw_name,
    std::string_view type,
    std::uint32_t property_count,
    std::vector<std::uint8_t>* out
) {
    append_text(raw_name, out);
    for (int i = 0; i < 10; i++) {
        append_u8(0, out);
    }
    append_label(type, out);
    append_u32be(property_count, out);
}

}  // namespace ps::tpl::test
