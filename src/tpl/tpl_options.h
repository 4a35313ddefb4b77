/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>

namespace ps::tpl {

struct ParserDecodeOptions {
    // Objc/VlLs nesting limit before MaxDepthExceeded is raised.
    std::size_t max_depth = 64;
    bool debug = false;
};

}  // namespace ps::tpl
