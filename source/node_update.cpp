// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_update.cpp
/// @brief Merge edited fields back into a JSON document.

#include <json_edit/node_update.h>
#include <json_edit/builders.h>
#include <json_edit/serialization.h>

namespace json_edit {

Value parse_edited_fields(const std::string& text)
{
    if (auto parsed = from_json(text)) {
        return std::move(*parsed);
    }
    return Value{text};
}

Value merge_leaf_fields(const Value& existing, const Value& edited)
{
    const auto* target = existing.get_if<ValueMap>();
    const auto* fields = edited.get_if<ValueMap>();
    if (target == nullptr || fields == nullptr) {
        detail::log_access_error("merge_leaf_fields", "both values must be objects");
        return existing;
    }

    MapBuilder merged(*target);
    for (const auto& entry : *fields) {
        const Value& val = entry.value.get();
        if (val.is_container()) {
            continue;
        }
        merged.set(entry.key, val);
    }
    return merged.finish();
}

UpdateResult update_json_by_path_checked(const std::string& document_text,
                                         const Path& path,
                                         const Value& edited_fields)
{
    std::string parse_error;
    auto document = from_json(document_text, &parse_error);
    if (!document) {
        detail::log_access_error("update_json_by_path", "document is not valid JSON: " + parse_error);
        return {document_text, UpdateStatus::DocumentParseError, PathError::None, std::move(parse_error)};
    }

    if (path.empty()) {
        return {to_json(edited_fields), UpdateStatus::Updated, PathError::None, {}};
    }

    auto update = update_at_path_vivify(*document, path, [&edited_fields](const Value* slot) -> Value {
        if (slot != nullptr && slot->is_map() && edited_fields.is_map()) {
            return merge_leaf_fields(*slot, edited_fields);
        }
        return edited_fields;
    });

    if (!update.ok()) {
        return {document_text,
                UpdateStatus::PathError,
                update.error,
                std::string(path_error_message(update.error)) + " at " + path_to_string(path)};
    }
    return {to_json(update.root), UpdateStatus::Updated, PathError::None, {}};
}

std::string update_json_by_path(const std::string& document_text,
                                const Path& path,
                                const Value& edited_fields)
{
    return update_json_by_path_checked(document_text, path, edited_fields).text;
}

} // namespace json_edit
