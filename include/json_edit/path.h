// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path type addressing one node inside a JSON document, and its text forms.
///
/// A Path is an ordered list of selectors. Each selector is either an object
/// key or an array index; the empty path addresses the document root.
///
/// ```cpp
/// Path path{"customer", std::size_t{0}, "id"};
/// path_to_json_path(path);   // $["customer"][0]["id"]
/// path_to_string(path);      // .customer[0].id
/// ```

#pragma once

#include "api.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace json_edit {

/// A single path element: either a string key or a numeric index
using PathElement = std::variant<std::string, std::size_t>;

/// Owning path from the document root to a node
using Path = std::vector<PathElement>;

/// Bracket notation shown to users: `$` then `["key"]` or `[index]` per selector.
/// Keys are wrapped in double quotes without further escaping.
[[nodiscard]] JSON_EDIT_API std::string path_to_json_path(const Path& path);

/// Dot notation used in diagnostics: `.key[index]`, or `/` for the root
[[nodiscard]] JSON_EDIT_API std::string path_to_string(const Path& path);

/// True when the selector is an array index
[[nodiscard]] inline bool is_index(const PathElement& elem) noexcept {
    return std::holds_alternative<std::size_t>(elem);
}

} // namespace json_edit
