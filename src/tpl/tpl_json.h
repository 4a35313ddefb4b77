/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "tpl_document.h"

#include <nlohmann/json.hpp>

namespace ps::tpl {

nlohmann::ordered_json value_to_json(const Value& value);
nlohmann::ordered_json property_to_json(const Property& property);
nlohmann::ordered_json document_to_json(const Document& doc);

}  // namespace ps::tpl
