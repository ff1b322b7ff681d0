// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_rows.h
/// @brief Flat field rows describing one node, and their editable text form.
///
/// A node is shown to the user as an ordered list of FieldRow, one per direct
/// child. Scalar children carry their value; array and object children are
/// markers only (the value is the child count) because their content lives
/// in the document and is edited through their own node.
///
/// ```cpp
/// Value node = Value::map({{"id", 7}, {"tags", Value::vector({"a"})}});
/// FieldRows rows = node_rows_from_value(node);
/// normalize_node_rows(rows);   // "{\n  \"id\": 7\n}"
/// ```

#pragma once

#include "api.h"
#include "value.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace json_edit {

enum class RowType {
    String,
    Number,
    Boolean,
    Null,
    Array,
    Object,
};

struct FieldRow {
    std::optional<std::string> key;  ///< absent for array elements and scalar nodes
    Value value;
    RowType type = RowType::Null;

    bool operator==(const FieldRow&) const = default;
};

using FieldRows = std::vector<FieldRow>;

[[nodiscard]] JSON_EDIT_API RowType row_type_of(const Value& val) noexcept;

/// Lowercase type name: "string", "number", "boolean", "null", "array", "object"
[[nodiscard]] JSON_EDIT_API std::string_view row_type_name(RowType type) noexcept;

[[nodiscard]] inline bool is_container_row(const FieldRow& row) noexcept {
    return row.type == RowType::Array || row.type == RowType::Object;
}

/// An empty key counts as no key
[[nodiscard]] inline bool has_key(const FieldRow& row) noexcept {
    return row.key.has_value() && !row.key->empty();
}

/// @brief Editable text for a node's rows
///
/// - No rows: `{}`
/// - A single row without a key (a scalar node): the value as bare text
/// - Otherwise: a 2-space indented JSON object of the keyed scalar rows, in
///   row order. Container rows and rows without a key are left out.
///
/// "Without a key" includes an empty key (see has_key).
[[nodiscard]] JSON_EDIT_API std::string normalize_node_rows(const FieldRows& rows);

/// @brief Rows for one document node
///
/// - Map: one keyed row per entry
/// - Vector: one unkeyed row per element
/// - Scalar: a single unkeyed row
[[nodiscard]] JSON_EDIT_API FieldRows node_rows_from_value(const Value& node);

} // namespace json_edit
