// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON value type backed by immer persistent containers.
///
/// This file defines the core Value type used to hold a decoded JSON document:
/// - Scalars: null (std::monostate), bool, int64_t, double, string
/// - Containers: map (insertion ordered object) and vector (array)
///
/// Integers and doubles are both JSON numbers. They are kept apart so that
/// integral literals survive a parse/serialize cycle unchanged, but they
/// compare equal when numerically equal.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include "json_edit_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace json_edit {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_EDIT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_EDIT_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_EDIT_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicMapEntry {
    std::string key;
    BasicValueBox<MemoryPolicy> value;
};

// ============================================================
// BasicValueMap - insertion ordered JSON object
//
// Entries live in an immer::vector in insertion order; an immer::map
// from key to entry position gives O(log n) lookup. Overwriting a key
// keeps its original position, new keys are appended.
// ============================================================

template <typename MemoryPolicy>
class BasicValueMap {
public:
    using value_box      = BasicValueBox<MemoryPolicy>;
    using entry_type     = BasicMapEntry<MemoryPolicy>;
    using entries_type   = immer::vector<entry_type, MemoryPolicy>;
    using index_type     = immer::map<std::string,
                                      std::size_t,
                                      std::hash<std::string>,
                                      std::equal_to<std::string>,
                                      MemoryPolicy>;
    using const_iterator = typename entries_type::const_iterator;

    class transient_type {
    public:
        void set(const std::string& key, value_box val) {
            if (const auto* pos = index_.find(key)) {
                entries_.set(*pos, entry_type{key, std::move(val)});
                return;
            }
            index_.set(key, entries_.size());
            entries_.push_back(entry_type{key, std::move(val)});
        }

        [[nodiscard]] const value_box* find(const std::string& key) const {
            if (const auto* pos = index_.find(key)) return &entries_[*pos].value;
            return nullptr;
        }

        [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
        [[nodiscard]] std::size_t size() const { return entries_.size(); }

        [[nodiscard]] BasicValueMap persistent() {
            return BasicValueMap{entries_.persistent(), index_.persistent()};
        }

    private:
        friend class BasicValueMap;

        transient_type(typename entries_type::transient_type entries,
                       typename index_type::transient_type index)
            : entries_(std::move(entries))
            , index_(std::move(index))
        {}

        typename entries_type::transient_type entries_;
        typename index_type::transient_type index_;
    };

    BasicValueMap() = default;

    [[nodiscard]] const value_box* find(const std::string& key) const {
        if (const auto* pos = index_.find(key)) return &entries_[*pos].value;
        return nullptr;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    [[nodiscard]] BasicValueMap set(const std::string& key, value_box val) const {
        if (const auto* pos = index_.find(key)) {
            return BasicValueMap{entries_.set(*pos, entry_type{key, std::move(val)}), index_};
        }
        return BasicValueMap{entries_.push_back(entry_type{key, std::move(val)}),
                             index_.set(key, entries_.size())};
    }

    [[nodiscard]] transient_type transient() const {
        return transient_type{entries_.transient(), index_.transient()};
    }

private:
    BasicValueMap(entries_type entries, index_type index)
        : entries_(std::move(entries))
        , index_(std::move(index))
    {}

    entries_type entries_;
    index_type index_;
};

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using map_entry     = BasicMapEntry<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 value_map,
                 value_vector>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_map() || is_vector(); }

    /// Pointer to the child under @p key, nullptr when absent or not a map
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    /// Pointer to the element at @p index, nullptr when out of range or not a vector
    [[nodiscard]] const BasicValue* find(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return &(*v)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* found = find(index)) return *found;
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-vector type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks, highest performance
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

// ============================================================
// Default Value Type Aliases
// ============================================================

using Value       = BasicValue<unsafe_memory_policy>;
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;
using MapEntry    = BasicMapEntry<unsafe_memory_policy>;

// ============================================================
// Structural equality
//
// - Numbers compare numerically: int64_t{1} == double{1.0}
// - Maps compare by key set and values, ignoring insertion order
// - Vectors compare element-wise
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    using value_map    = typename BasicValue<MemoryPolicy>::value_map;
    using value_vector = typename BasicValue<MemoryPolicy>::value_vector;

    if (a.is_number() && b.is_number()) {
        if (a.template is<int64_t>() && b.template is<int64_t>()) {
            return *a.template get_if<int64_t>() == *b.template get_if<int64_t>();
        }
        return a.as_number() == b.as_number();
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    if (auto* lhs = a.template get_if<value_map>()) {
        const auto& rhs = *b.template get_if<value_map>();
        if (lhs->size() != rhs.size()) return false;
        for (const auto& entry : *lhs) {
            const auto* other = rhs.find(entry.key);
            if (other == nullptr || !(entry.value.get() == other->get())) return false;
        }
        return true;
    }
    if (auto* lhs = a.template get_if<value_vector>()) {
        const auto& rhs = *b.template get_if<value_vector>();
        if (lhs->size() != rhs.size()) return false;
        for (std::size_t i = 0; i < lhs->size(); ++i) {
            if (!((*lhs)[i].get() == rhs[i].get())) return false;
        }
        return true;
    }
    if (auto* lhs = a.template get_if<std::string>()) {
        return *lhs == *b.template get_if<std::string>();
    }
    if (auto* lhs = a.template get_if<bool>()) {
        return *lhs == *b.template get_if<bool>();
    }
    return true;  // both null
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

/// Debug representation: strings quoted, containers summarized ("{map:3}")
[[nodiscard]] JSON_EDIT_API std::string value_to_string(const Value& val);

/// Text a scalar shows in an editor field: strings unquoted, numbers in
/// ECMAScript form, "true"/"false", "null". Containers render as JSON.
[[nodiscard]] JSON_EDIT_API std::string value_to_display_text(const Value& val);

/// ECMAScript Number::toString rendering ("1", "1.5", "1e+21", "1e-7").
/// Non-finite values render as "null", the JSON spelling.
[[nodiscard]] JSON_EDIT_API std::string format_number(double value);

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

JSON_EDIT_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;
JSON_EDIT_EXTERN_TEMPLATE class BasicValueMap<unsafe_memory_policy>;

} // namespace json_edit
