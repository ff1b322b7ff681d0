// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node_update.h
/// @brief Write edited leaf fields back into a serialized JSON document.
///
/// The document travels as JSON text. Every update parses it, rewrites the
/// node at the given path and re-serializes the whole tree with 2-space
/// indentation.
///
/// Slot policy at the end of the path:
/// - Slot holds an object and the edit is an object: the existing object is
///   kept and only the edit's scalar fields (null included) overwrite it.
///   Nested objects/arrays of the slot survive even when absent from the edit,
///   and container values in the edit are ignored.
/// - Anything else (scalar, array or missing slot, or a non-object edit):
///   the slot is replaced by the edit.
///
/// An empty path replaces the whole document.
///
/// Failures never throw. The text comes back unchanged when the document does
/// not parse (nesting past JSON_EDIT_MAX_DEPTH included), or when the path runs
/// into a scalar, applies a key to an array or indexes more than
/// JSON_EDIT_MAX_ARRAY_PADDING slots past the end of an array.

#pragma once

#include "api.h"
#include "path.h"
#include "path_core.h"
#include "value.h"

#include <string>

namespace json_edit {

enum class UpdateStatus {
    Updated,
    DocumentParseError,
    PathError,
};

struct UpdateResult {
    std::string text;  ///< updated document, or the input text on failure
    UpdateStatus status = UpdateStatus::Updated;
    PathError path_error = PathError::None;
    std::string error;

    [[nodiscard]] bool updated() const noexcept { return status == UpdateStatus::Updated; }
};

/// Value typed by the user. Text that is not valid JSON becomes a string
/// holding the raw text.
[[nodiscard]] JSON_EDIT_API Value parse_edited_fields(const std::string& text);

/// Copy of @p existing with the scalar fields of @p edited written over it.
/// Both must be maps; otherwise @p existing is returned unchanged.
[[nodiscard]] JSON_EDIT_API Value merge_leaf_fields(const Value& existing, const Value& edited);

/// Apply @p edited_fields at @p path and report what happened
[[nodiscard]] JSON_EDIT_API UpdateResult update_json_by_path_checked(const std::string& document_text,
                                                                    const Path& path,
                                                                    const Value& edited_fields);

/// Apply @p edited_fields at @p path; returns @p document_text unchanged on failure
[[nodiscard]] JSON_EDIT_API std::string update_json_by_path(const std::string& document_text,
                                                           const Path& path,
                                                           const Value& edited_fields);

} // namespace json_edit
