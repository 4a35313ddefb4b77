/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ps::tpl {

struct Value;
struct Property;

using ValueList = std::vector<Value>;
using PropertyList = std::vector<Property>;

struct EnumValue {
    std::string class_id;
    std::string value;

    bool operator==(const EnumValue&) const = default;
};

struct UnitFloat {
    std::string unit;
    double value = 0.0;

    bool operator==(const UnitFloat&) const = default;
};

// std::monostate marks a list slot whose tag is recognized but not decodable.
struct Value {
    using Storage = std::variant<
        std::monostate,
        bool,
        std::uint64_t,
        double,
        std::string,
        EnumValue,
        UnitFloat,
        ValueList,
        PropertyList>;

    Storage data;

    bool is_null() const { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&data);
    }

    bool operator==(const Value& other) const;
};

struct TypedValue {
    std::string type;
    Value value;

    bool operator==(const TypedValue&) const = default;
};

// At most one entry. No entry for "null"-named properties and for tags that
// carry no representable value.
struct Property {
    std::string name;
    std::optional<TypedValue> entry;

    bool empty() const { return !entry.has_value(); }

    bool operator==(const Property&) const = default;
};

struct ToolRecord {
    std::string name;
    PropertyList properties;

    bool operator==(const ToolRecord&) const = default;
};

struct ToolGroup {
    std::string type;
    std::vector<ToolRecord> tools;

    bool operator==(const ToolGroup&) const = default;
};

// Tool records keyed by type label, in first-seen order.
struct Document {
    std::vector<ToolGroup> groups;

    bool empty() const { return groups.empty(); }
    std::size_t tool_count() const;

    const ToolGroup* find(std::string_view type) const;
    std::vector<ToolRecord>& tools_for(std::string_view type);

    bool operator==(const Document&) const = default;
};

}  // namespace ps::tpl
