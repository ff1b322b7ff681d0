// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// This file provides transient-based builders for constructing Value containers:
/// - MapBuilder: Build value_map efficiently (keys keep insertion order)
/// - VectorBuilder: Build value_vector efficiently
///
/// Usage:
/// @code
///   #include <json_edit/builders.h>
///
///   Value customer = MapBuilder()
///       .set("id", 42)
///       .set("name", "Ada")
///       .finish();
///
///   Value tags = VectorBuilder()
///       .push_back("new")
///       .push_back("vip")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace json_edit {

/// Builder for constructing value_map efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}
    explicit BasicMapBuilder(const value_map& existing) : transient_(existing.transient()) {}

    /// Start from the entries of an existing map Value (empty for other types)
    explicit BasicMapBuilder(const value_type& existing)
        : transient_(existing.template is<value_map>()
            ? existing.template get_if<value_map>()->transient()
            : value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Get a previously set value by key, or @p default_val when absent
    [[nodiscard]] value_type get(const std::string& key, value_type default_val = value_type{}) const {
        if (auto* found = transient_.find(key)) {
            return found->get();
        }
        return default_val;
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing value_vector efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    explicit BasicVectorBuilder(const value_vector& existing)
        : transient_(existing.transient()) {}

    explicit BasicVectorBuilder(const value_type& existing)
        : transient_(existing.template is<value_vector>()
            ? existing.template get_if<value_vector>()->transient()
            : value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    /// Set value at index, padding with nulls when @p index is past the end
    BasicVectorBuilder& set(std::size_t index, value_type val) {
        while (transient_.size() <= index) {
            transient_.push_back(value_box{});
        }
        transient_.set(index, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type get(std::size_t index, value_type default_val = value_type{}) const {
        if (index < transient_.size()) {
            return transient_[index].get();
        }
        return default_val;
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

using MapBuilder = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

JSON_EDIT_EXTERN_TEMPLATE class BasicMapBuilder<unsafe_memory_policy>;
JSON_EDIT_EXTERN_TEMPLATE class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace json_edit
