/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_value_decoder.h"
#include "tpl/tpl_tags.h"
#include "utils/log.h"

#include <algorithm>
#include <utility>

namespace ps::tpl {

static std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); i++) {
        const std::uint8_t b = bytes[i];
        out[i * 2] = hexdig[(b >> 4) & 0xF];
        out[i * 2 + 1] = hexdig[b & 0xF];
    }
    return out;
}

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string ascii_string(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (const auto b : bytes) {
        out.push_back(static_cast<char>(b & 0x7Fu));
    }
    return out;
}

std::string trim_ascii(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_ascii_space(s[begin])) {
        begin++;
    }
    while (end > begin && is_ascii_space(s[end - 1])) {
        end--;
    }
    return std::string(s.substr(begin, end - begin));
}

// Counts non-overlapping "00" digit pairs in the hex rendering, so a pair may
// straddle two bytes (0x10 0x01 counts once).
std::size_t count_hex_zero_pairs(std::span<const std::uint8_t> bytes) {
    const std::string hex = bytes_to_hex(bytes);
    std::size_t count = 0;
    std::size_t i = 0;
    while (i + 1 < hex.size()) {
        if (hex[i] == '0' && hex[i + 1] == '0') {
            count++;
            i += 2;
        } else {
            i++;
        }
    }
    return count;
}

DescriptorDecoder::DepthScope::DepthScope(DescriptorDecoder& owner) : _owner(owner) {
    if (_owner._depth >= _owner._options.max_depth) {
        throw DecodeError(
            DecodeErrorKind::MaxDepthExceeded, _owner._reader.position(),
            "descriptor nesting deeper than " + std::to_string(_owner._options.max_depth)
        );
    }
    _owner._depth++;
}

DescriptorDecoder::DepthScope::~DepthScope() {
    _owner._depth--;
}

DescriptorDecoder::DescriptorDecoder(ByteReader& reader, ParserDecodeOptions options)
    : _reader(reader), _options(options) {}

std::string DescriptorDecoder::read_tag() {
    return ascii_string(_reader.read_bytes(kTagSize));
}

std::span<const std::uint8_t> DescriptorDecoder::extract_label() {
    const std::uint32_t len = _reader.read_u32_be();
    if (len == 0) {
        return _reader.read_bytes(kTagSize);
    }
    return _reader.read_bytes(len);
}

Property DescriptorDecoder::extract_property() {
    const std::string raw_name = ascii_string(extract_label());
    if (raw_name == "null") {
        return Property{raw_name, std::nullopt};
    }
    std::string tag = read_tag();
    std::string name = trim_ascii(raw_name);
    auto decoded = read_tagged_value(name, std::move(tag));
    if (!decoded.has_value()) {
        return Property{std::move(name), std::nullopt};
    }
    return Property{std::move(decoded->name), std::move(decoded->typed)};
}

PropertyList DescriptorDecoder::extract_object_class(std::string_view name) {
    std::uint32_t count = 0;
    if (name == "Grad") {
        // Gradient descriptors carry their name inline and always hold four properties.
        extract_text();
        count = 4;
    } else {
        _reader.skip(6);
        extract_label();
        count = _reader.read_u32_be();
    }

    PropertyList properties;
    for (std::uint32_t i = 0; i < count; i++) {
        properties.push_back(extract_property());
    }
    return properties;
}

ValueList DescriptorDecoder::extract_list() {
    const std::uint32_t count = _reader.read_u32_be();
    ValueList values;
    for (std::uint32_t i = 0; i < count; i++) {
        std::string tag = read_tag();
        std::string slot = std::to_string(i);
        auto decoded = read_tagged_value(slot, std::move(tag));
        // A slot renamed by the placeholder scan no longer resolves to its index.
        if (decoded.has_value() && decoded->name == slot) {
            values.push_back(std::move(decoded->typed.value));
        } else {
            values.push_back(Value{});
        }
    }
    return values;
}

std::string DescriptorDecoder::extract_text() {
    std::uint32_t length = _reader.read_u32_be();

    // A zero length hides an embedded property in front of the real text. Consume
    // it, then accept the next nonzero length only if the zero-pair count of its
    // payload matches length + 1 (UTF-16 high bytes plus the terminator).
    while (length == 0) {
        _reader.seek(_reader.position() - 4);
        extract_property();
        length = _reader.read_u32_be();
        if (length != 0) {
            const std::size_t want = static_cast<std::size_t>(length) * 2;
            const auto peek = _reader.peek_bytes(std::min(want, _reader.remaining()));
            if (count_hex_zero_pairs(peek) == static_cast<std::size_t>(length) + 1) {
                break;
            }
            length = 0;
        }
    }

    const auto units = _reader.read_bytes(static_cast<std::size_t>(length) * 2);
    std::string text;
    text.reserve(length);
    for (const auto b : units) {
        const char c = static_cast<char>(b & 0x7Fu);
        if (c != '\0') {
            text.push_back(c);
        }
    }
    return text;
}

EnumValue DescriptorDecoder::extract_enum() {
    EnumValue out{};
    std::uint32_t class_len = _reader.read_u32_be();
    if (class_len == 0) {
        class_len = 4;
    }
    out.class_id = ascii_string(_reader.read_bytes(class_len));

    std::uint32_t value_len = _reader.read_u32_be();
    if (value_len == 0) {
        value_len = 4;
    }
    out.value = ascii_string(_reader.read_bytes(value_len));
    return out;
}

UnitFloat DescriptorDecoder::extract_unit_float() {
    UnitFloat out{};
    out.unit = ascii_string(_reader.read_bytes(4));
    out.value = _reader.read_f64_be();
    return out;
}

void DescriptorDecoder::scan_placeholder(std::string& name, std::string& tag) {
    const std::size_t start = _reader.position();
    std::string prefix = name + tag;
    while (true) {
        if (_reader.remaining() == 0) {
            throw DecodeError(
                DecodeErrorKind::UnrecoverablePlaceholderScan, start,
                "no known tag after unrecognized tag '" + tag + "' of property '" + name + "'"
            );
        }
        prefix.push_back(static_cast<char>(_reader.read_u8() & 0x7Fu));
        if (ends_with_placeholder(prefix).has_value()) {
            break;
        }
    }

    // The split is always four characters wide, even when "dou" matched.
    tag = prefix.substr(prefix.size() - kTagSize);
    name = prefix.substr(0, prefix.size() - kTagSize);
    if (_options.debug) {
        PS_LOG_WARN(
            "    placeholder scan: %zu bytes skipped, recovered tag '%s' at %zu",
            _reader.position() - start, tag.c_str(), _reader.position()
        );
    }
}

std::optional<NamedValue> DescriptorDecoder::read_tagged_value(std::string name, std::string tag) {
    DepthScope scope(*this);

    while (true) {
        NamedValue out{};
        out.typed.type = tag;
        switch (classify_tag(tag)) {
            case TagKind::ObjectClass:
                out.typed.value.data = extract_object_class(name);
                break;
            case TagKind::List:
                out.typed.value.data = extract_list();
                break;
            case TagKind::Double:
                out.typed.value.data = _reader.read_f64_be();
                break;
            case TagKind::UnitFloat:
                out.typed.value.data = extract_unit_float();
                break;
            case TagKind::Text:
                out.typed.value.data = extract_text();
                break;
            case TagKind::Enum:
                out.typed.value.data = extract_enum();
                break;
            case TagKind::Long:
                out.typed.value.data = static_cast<std::uint64_t>(_reader.read_u32_be());
                break;
            case TagKind::Comp:
                out.typed.value.data = _reader.read_u64_be();
                break;
            case TagKind::Bool:
                out.typed.value.data = _reader.read_u8() != 0;
                break;
            case TagKind::Unsupported:
                if (_options.debug) {
                    PS_LOG_INFO(
                        "    unsupported tag '%s' for '%s' at %zu", tag.c_str(), name.c_str(),
                        _reader.position()
                    );
                }
                return std::nullopt;
            case TagKind::Unknown:
                scan_placeholder(name, tag);
                continue;
        }
        out.name = std::move(name);
        return out;
    }
}

}  // namespace ps::tpl
