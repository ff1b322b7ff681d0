// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.h
/// @brief Path traversal and auto-vivifying updates on Value trees.
///
/// Values are persistent, so an update never modifies its input: the nodes on
/// the path are copied and the new root is returned (path copying).
///
/// Selector semantics:
/// - A string key applies to a map. Applied to a vector it is an error.
/// - An index applies to a vector. Applied to a map it addresses the decimal
///   string key (`3` -> `"3"`).
/// - A missing intermediate is created: a vector when the next selector is an
///   index, otherwise a map. Vectors grow with `null` padding, by at most
///   JSON_EDIT_MAX_ARRAY_PADDING slots.
/// - A scalar or `null` sitting where a container is needed is an error.
///
/// ```cpp
/// auto update = update_at_path_vivify(Value{ValueMap{}}, Path{"p", "q"},
///     [](const Value* slot) { return Value::map({{"v", 1}}); });
/// // update.root: {"p": {"q": {"v": 1}}}
/// ```

#pragma once

#include "api.h"
#include "path.h"
#include "value.h"

#include <functional>
#include <string_view>

namespace json_edit {

/// Why a path could not be applied to a tree
enum class PathError {
    None,
    EmptyPath,      ///< operation needs at least one selector
    NotAContainer,  ///< a scalar or null sits where a map/vector is required
    KeyOnArray,     ///< a string key was applied to a vector
    IndexTooLarge,  ///< index lies more than JSON_EDIT_MAX_ARRAY_PADDING past the end
};

[[nodiscard]] JSON_EDIT_API std::string_view path_error_message(PathError error) noexcept;

/// Container one level above the target slot, plus the final selector
struct ResolvedParent {
    Value parent;
    PathElement last;
    PathError error = PathError::None;
    std::size_t failed_at = 0;  ///< selector index where resolution stopped

    [[nodiscard]] bool ok() const noexcept { return error == PathError::None; }
};

/// Result of an update; on error @c root is the unchanged input
struct PathUpdate {
    Value root;
    PathError error = PathError::None;
    std::size_t failed_at = 0;

    [[nodiscard]] bool ok() const noexcept { return error == PathError::None; }
};

/// Computes the new slot value from the current one (nullptr when absent)
using SlotUpdater = std::function<Value(const Value* slot)>;

namespace detail {

/// Object key a selector addresses (indices as decimal strings)
[[nodiscard]] inline std::string key_of(const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return *key;
    }
    return std::to_string(std::get<std::size_t>(elem));
}

/// Child under @p elem, nullptr when absent or @p current is not a container
[[nodiscard]] inline const Value* find_child(const Value& current, const PathElement& elem)
{
    if (current.is_map()) {
        return current.find(key_of(elem));
    }
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        return current.find(*idx);
    }
    return nullptr;
}

/// Empty container to synthesize in front of @p next
[[nodiscard]] inline Value empty_container_for(const PathElement& next)
{
    if (is_index(next)) {
        return Value{ValueVector{}};
    }
    return Value{ValueMap{}};
}

} // namespace detail

/// @brief Find the node at a path without creating anything
/// @return Pointer into @p root, or nullptr if any step is missing
[[nodiscard]] inline const Value* find_at_path(const Value& root, const Path& path)
{
    const Value* current = &root;
    for (const auto& elem : path) {
        current = detail::find_child(*current, elem);
        if (current == nullptr) [[unlikely]] {
            break;
        }
    }
    return current;
}

/// @brief Get value at a path
/// @return The value at the path, or null Value if any step fails
[[nodiscard]] inline Value get_at_path(const Value& root, const Path& path)
{
    if (const auto* found = find_at_path(root, path)) {
        return *found;
    }
    return Value{};
}

/// @brief Resolve the parent of the slot addressed by @p path
///
/// Walks every selector but the last. Missing intermediates are synthesized
/// in the returned parent only; @p root is not modified. The final selector
/// is returned as @c last and is not looked up.
[[nodiscard]] JSON_EDIT_API ResolvedParent resolve_parent(const Value& root, const Path& path);

/// @brief Update the slot at @p path, creating missing intermediates
///
/// Calls @p fn with the current slot value (nullptr when the slot is absent)
/// and writes its result back. On error @p fn is not called and the input
/// root is returned together with the error. An empty path updates the root
/// itself.
[[nodiscard]] JSON_EDIT_API PathUpdate update_at_path_vivify(const Value& root,
                                                            const Path& path,
                                                            const SlotUpdater& fn);

/// @brief Set value at a path with auto-vivification
[[nodiscard]] JSON_EDIT_API PathUpdate set_at_path_vivify(const Value& root,
                                                         const Path& path,
                                                         Value new_val);

} // namespace json_edit
