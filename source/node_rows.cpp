// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_rows.cpp
/// @brief Field rows and their editable text form.

#include <json_edit/node_rows.h>
#include <json_edit/builders.h>
#include <json_edit/serialization.h>

namespace json_edit {

RowType row_type_of(const Value& val) noexcept
{
    return std::visit([](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return RowType::String;
        } else if constexpr (std::is_same_v<T, bool>) {
            return RowType::Boolean;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return RowType::Number;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return RowType::Object;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return RowType::Array;
        } else {
            return RowType::Null;
        }
    }, val.data);
}

std::string_view row_type_name(RowType type) noexcept
{
    switch (type) {
        case RowType::String:  return "string";
        case RowType::Number:  return "number";
        case RowType::Boolean: return "boolean";
        case RowType::Null:    return "null";
        case RowType::Array:   return "array";
        case RowType::Object:  return "object";
    }
    return "null";
}

std::string normalize_node_rows(const FieldRows& rows)
{
    if (rows.empty()) {
        return "{}";
    }
    if (rows.size() == 1 && !has_key(rows.front())) {
        return value_to_display_text(rows.front().value);
    }

    MapBuilder builder;
    for (const auto& row : rows) {
        if (is_container_row(row) || !has_key(row)) {
            continue;
        }
        builder.set(*row.key, row.value);
    }
    return to_json(builder.finish());
}

namespace {

FieldRow make_row(std::optional<std::string> key, const Value& child)
{
    const auto type = row_type_of(child);
    if (child.is_container()) {
        return {std::move(key), Value{child.size()}, type};
    }
    return {std::move(key), child, type};
}

} // anonymous namespace

FieldRows node_rows_from_value(const Value& node)
{
    FieldRows rows;
    if (auto* m = node.get_if<ValueMap>()) {
        rows.reserve(m->size());
        for (const auto& entry : *m) {
            rows.push_back(make_row(entry.key, entry.value.get()));
        }
    } else if (auto* v = node.get_if<ValueVector>()) {
        rows.reserve(v->size());
        for (const auto& elem : *v) {
            rows.push_back(make_row(std::nullopt, elem.get()));
        }
    } else {
        rows.push_back(make_row(std::nullopt, node));
    }
    return rows;
}

} // namespace json_edit
