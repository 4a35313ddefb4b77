/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_tags.h"

#include <utility>

namespace ps::tpl {

static const std::array<std::pair<std::string_view, TagKind>, 14> kTagMap = {{
    {"Objc", TagKind::ObjectClass},
    {"VlLs", TagKind::List},
    {"doub", TagKind::Double},
    {"UntF", TagKind::UnitFloat},
    {"TEXT", TagKind::Text},
    {"enum", TagKind::Enum},
    {"long", TagKind::Long},
    {"comp", TagKind::Comp},
    {"bool", TagKind::Bool},
    {"type", TagKind::Unsupported},
    {"GlbC", TagKind::Unsupported},
    {"obj ", TagKind::Unsupported},
    {"alis", TagKind::Unsupported},
    {"tdta", TagKind::Unsupported},
}};

TagKind classify_tag(std::string_view tag) {
    for (const auto& [k, v] : kTagMap) {
        if (k == tag) {
            return v;
        }
    }
    return TagKind::Unknown;
}

std::optional<std::string_view> ends_with_placeholder(std::string_view text) {
    for (const auto literal : kPlaceholderTags) {
        if (text.size() >= literal.size()
            && text.compare(text.size() - literal.size(), literal.size(), literal) == 0) {
            return literal;
        }
    }
    return std::nullopt;
}

}  // namespace ps::tpl
