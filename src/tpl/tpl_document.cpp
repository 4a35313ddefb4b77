/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_document.h"

namespace ps::tpl {

bool Value::operator==(const Value& other) const {
    return data == other.data;
}

std::size_t Document::tool_count() const {
    std::size_t n = 0;
    for (const auto& g : groups) {
        n += g.tools.size();
    }
    return n;
}

const ToolGroup* Document::find(std::string_view type) const {
    for (const auto& g : groups) {
        if (g.type == type) {
            return &g;
        }
    }
    return nullptr;
}

std::vector<ToolRecord>& Document::tools_for(std::string_view type) {
    for (auto& g : groups) {
        if (g.type == type) {
            return g.tools;
        }
    }
    groups.push_back(ToolGroup{std::string(type), {}});
    return groups.back().tools;
}

}  // namespace ps::tpl
