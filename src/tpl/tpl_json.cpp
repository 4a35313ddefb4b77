/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_json.h"

#include <variant>

namespace ps::tpl {

namespace {
struct JsonVisitor {
    nlohmann::ordered_json operator()(std::monostate) const { return nullptr; }
    nlohmann::ordered_json operator()(bool v) const { return v; }
    nlohmann::ordered_json operator()(std::uint64_t v) const { return v; }
    nlohmann::ordered_json operator()(double v) const { return v; }
    nlohmann::ordered_json operator()(const std::string& v) const { return v; }

    nlohmann::ordered_json operator()(const EnumValue& v) const {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        j["classId"] = v.class_id;
        j["value"] = v.value;
        return j;
    }

    nlohmann::ordered_json operator()(const UnitFloat& v) const {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        j["unit"] = v.unit;
        j["value"] = v.value;
        return j;
    }

    nlohmann::ordered_json operator()(const ValueList& v) const {
        nlohmann::ordered_json j = nlohmann::ordered_json::array();
        for (const auto& el : v) {
            j.push_back(value_to_json(el));
        }
        return j;
    }

    nlohmann::ordered_json operator()(const PropertyList& v) const {
        nlohmann::ordered_json j = nlohmann::ordered_json::array();
        for (const auto& p : v) {
            j.push_back(property_to_json(p));
        }
        return j;
    }
};
}  // namespace

nlohmann::ordered_json value_to_json(const Value& value) {
    return std::visit(JsonVisitor{}, value.data);
}

nlohmann::ordered_json property_to_json(const Property& property) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    if (property.empty()) {
        return j;
    }
    nlohmann::ordered_json inner = nlohmann::ordered_json::object();
    inner["type"] = property.entry->type;
    inner["value"] = value_to_json(property.entry->value);
    j[property.name] = std::move(inner);
    return j;
}

nlohmann::ordered_json document_to_json(const Document& doc) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& group : doc.groups) {
        nlohmann::ordered_json tools = nlohmann::ordered_json::array();
        for (const auto& tool : group.tools) {
            nlohmann::ordered_json t = nlohmann::ordered_json::object();
            t["name"] = tool.name;
            nlohmann::ordered_json props = nlohmann::ordered_json::array();
            for (const auto& p : tool.properties) {
                props.push_back(property_to_json(p));
            }
            t["properties"] = std::move(props);
            tools.push_back(std::move(t));
        }
        j[group.type] = std::move(tools);
    }
    return j;
}

}  // namespace ps::tpl
