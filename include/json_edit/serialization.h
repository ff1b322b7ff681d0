// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text codec for the Value type.
///
/// Output follows the layout of ECMAScript JSON.stringify:
/// - Pretty mode indents by JSON_EDIT_INDENT_WIDTH spaces and writes `"key": value`
/// - Empty containers render as `{}` and `[]`
/// - Numbers use the ECMAScript Number::toString form (see format_number)
/// - Object keys keep insertion order
/// - Lone UTF-16 surrogates in strings are written as `\uXXXX` escapes
///
/// Usage:
/// @code
///   #include <json_edit/serialization.h>
///
///   std::string error;
///   if (auto doc = from_json(R"({"id": 1, "tags": ["a"]})", &error)) {
///       std::string pretty = to_json(*doc);         // 2-space indented
///       std::string line   = to_json(*doc, true);   // {"id":1,"tags":["a"]}
///   }
/// @endcode

#pragma once

#include "api.h"
#include "value.h"

#include <optional>
#include <string>

namespace json_edit {

/// Serialize a Value to JSON text
/// @param val The Value to serialize
/// @param compact If true, no whitespace; otherwise indented output
[[nodiscard]] JSON_EDIT_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON text into a Value
///
/// Leading and trailing whitespace is accepted, any other trailing content is
/// an error. Integers that fit in int64_t are stored as int64_t, every other
/// number as double. Containers nested deeper than JSON_EDIT_MAX_DEPTH are
/// rejected.
///
/// @param json_str JSON text
/// @param error_out Optional pointer receiving the error message on failure
/// @return The parsed Value, or std::nullopt on malformed input
[[nodiscard]] JSON_EDIT_API std::optional<Value> from_json(const std::string& json_str,
                                                          std::string* error_out = nullptr);

/// Escape a string for embedding between JSON double quotes
[[nodiscard]] JSON_EDIT_API std::string json_escape_string(const std::string& s);

} // namespace json_edit
