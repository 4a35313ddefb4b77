/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace ps::tpl {

enum class TagKind {
    ObjectClass,
    List,
    Double,
    UnitFloat,
    Text,
    Enum,
    Long,
    Comp,
    Bool,
    Unsupported,
    Unknown,
};

constexpr std::size_t kTagSize = 4;

// Literals that end a placeholder scan. "dou" is three bytes and matches
// before the trailing 'b' of "doub" is consumed.
inline constexpr std::array<std::string_view, 15> kPlaceholderTags = {
    "GlbO", "Objc", "VlLs", "dou",  "UntF", "TEXT", "enum", "long",
    "comp", "bool", "type", "GlbC", "obj ", "alis", "tdta",
};

TagKind classify_tag(std::string_view tag);
std::optional<std::string_view> ends_with_placeholder(std::string_view text);

}  // namespace ps::tpl
