// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// This file provides transient-based builders for constructing Value containers:
/// - MapBuilder: Build ValueMap efficiently (insertion order is kept)
/// - VectorBuilder: Build ValueVector efficiently
///
/// Usage:
/// @code
///   #include <treepatch/builders.h>
///
///   Value config = MapBuilder()
///       .set("width", 1920)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace treepatch {

/// Builder for constructing ValueMap efficiently - O(n) complexity
class MapBuilder {
public:
    using index_transient = ValueMap::index_type::transient_type;
    using order_transient = ValueMap::order_type::transient_type;

    MapBuilder()
        : index_(ValueMap::index_type{}.transient())
        , order_(ValueMap::order_type{}.transient()) {}

    // Move operations (allowed)
    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    /// Set a key-value pair; an existing key keeps its position
    MapBuilder& set(const std::string& key, Value val) {
        return set_box(key, ValueBox{std::move(val)});
    }

    /// Set a key to an existing box (shares the subtree, no copy)
    MapBuilder& set_box(const std::string& key, ValueBox box) {
        if (index_.count(key) == 0) {
            order_.push_back(key);
        }
        index_.set(key, std::move(box));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return order_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{finish_map()};
    }

    /// Finish and return just the map (not wrapped in Value)
    [[nodiscard]] ValueMap finish_map() {
        return ValueMap{index_.persistent(), order_.persistent()};
    }

private:
    index_transient index_;
    order_transient order_;
};

/// Builder for constructing ValueVector efficiently - O(n) complexity
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}

    // Move operations (allowed)
    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    /// Append a value to the end
    VectorBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    /// Append an existing box (shares the subtree, no copy)
    VectorBuilder& push_back_box(ValueBox box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    /// Finish and return just the vector (not wrapped in Value)
    [[nodiscard]] ValueVector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace treepatch
