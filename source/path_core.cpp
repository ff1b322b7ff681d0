// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.cpp
/// @brief Path traversal and auto-vivifying updates.

#include <json_edit/path_core.h>

namespace json_edit {

std::string_view path_error_message(PathError error) noexcept
{
    switch (error) {
        case PathError::None:          return "no error";
        case PathError::EmptyPath:     return "path is empty";
        case PathError::NotAContainer: return "value on path is not an object or array";
        case PathError::KeyOnArray:    return "string key applied to an array";
        case PathError::IndexTooLarge: return "array index too far past the end";
    }
    return "unknown path error";
}

namespace {

/// Check that @p container can hold the slot @p elem
PathError check_parent(const Value& container, const PathElement& elem)
{
    if (container.is_map()) {
        return PathError::None;
    }
    if (const auto* v = container.get_if<ValueVector>()) {
        const auto* idx = std::get_if<std::size_t>(&elem);
        if (idx == nullptr) {
            return PathError::KeyOnArray;
        }
        if (*idx > v->size() && *idx - v->size() > JSON_EDIT_MAX_ARRAY_PADDING) {
            return PathError::IndexTooLarge;
        }
        return PathError::None;
    }
    return PathError::NotAContainer;
}

/// Child to descend into under @p elem; synthesized from @p next when missing
PathError child_for_walk(const Value& container,
                         const PathElement& elem,
                         const PathElement& next,
                         Value& out)
{
    if (auto err = check_parent(container, elem); err != PathError::None) {
        return err;
    }
    if (const auto* found = detail::find_child(container, elem)) {
        out = *found;
    } else {
        out = detail::empty_container_for(next);
    }
    return PathError::None;
}

/// Write @p new_val into an already validated container
Value write_slot(const Value& container, const PathElement& elem, Value new_val)
{
    if (auto* m = container.get_if<ValueMap>()) {
        return m->set(detail::key_of(elem), ValueBox{std::move(new_val)});
    }

    const auto& v = *container.get_if<ValueVector>();
    const auto idx = std::get<std::size_t>(elem);
    if (idx < v.size()) {
        return v.set(idx, ValueBox{std::move(new_val)});
    }
    // Use transient mode for O(N) batch push_back; padding shares one null box
    const ValueBox null_box;
    auto trans = v.transient();
    while (trans.size() < idx) {
        trans.push_back(null_box);
    }
    trans.push_back(ValueBox{std::move(new_val)});
    return trans.persistent();
}

PathUpdate update_recursive(const Value& node,
                            const Path& path,
                            std::size_t path_index,
                            const SlotUpdater& fn)
{
    const auto& elem = path[path_index];

    if (path_index + 1 == path.size()) {
        if (auto err = check_parent(node, elem); err != PathError::None) {
            return {node, err, path_index};
        }
        const Value* slot = detail::find_child(node, elem);
        return {write_slot(node, elem, fn(slot)), PathError::None, path_index};
    }

    Value child;
    if (auto err = child_for_walk(node, elem, path[path_index + 1], child); err != PathError::None) {
        return {node, err, path_index};
    }

    auto inner = update_recursive(child, path, path_index + 1, fn);
    if (!inner.ok()) {
        return {node, inner.error, inner.failed_at};
    }
    return {write_slot(node, elem, std::move(inner.root)), PathError::None, inner.failed_at};
}

} // anonymous namespace

ResolvedParent resolve_parent(const Value& root, const Path& path)
{
    if (path.empty()) {
        detail::log_access_error("resolve_parent", path_error_message(PathError::EmptyPath));
        return {root, PathElement{}, PathError::EmptyPath, 0};
    }

    Value current = root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        Value child;
        if (auto err = child_for_walk(current, path[i], path[i + 1], child); err != PathError::None) {
            detail::log_access_error("resolve_parent",
                std::string(path_error_message(err)) + " at " + path_to_string(path));
            return {std::move(current), path.back(), err, i};
        }
        current = std::move(child);
    }

    const std::size_t last_index = path.size() - 1;
    if (auto err = check_parent(current, path.back()); err != PathError::None) {
        detail::log_access_error("resolve_parent",
            std::string(path_error_message(err)) + " at " + path_to_string(path));
        return {std::move(current), path.back(), err, last_index};
    }
    return {std::move(current), path.back(), PathError::None, last_index};
}

PathUpdate update_at_path_vivify(const Value& root, const Path& path, const SlotUpdater& fn)
{
    if (path.empty()) {
        return {fn(&root), PathError::None, 0};
    }

    auto result = update_recursive(root, path, 0, fn);
    if (!result.ok()) {
        detail::log_access_error("update_at_path_vivify",
            std::string(path_error_message(result.error)) + " at " + path_to_string(path) +
            " (selector " + std::to_string(result.failed_at) + ")");
    }
    return result;
}

PathUpdate set_at_path_vivify(const Value& root, const Path& path, Value new_val)
{
    return update_at_path_vivify(root, path, [&new_val](const Value*) { return std::move(new_val); });
}

} // namespace json_edit
