// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type definition for JSON-like tree data.
///
/// This file defines the core Value type that can represent:
/// - Null (std::monostate)
/// - Primitive types: bool, int64_t, double, string
/// - Container types: ValueVector (ordered sequence) and ValueMap
///   (insertion-ordered mapping), both built on immer's immutable containers
///
/// Values never change after construction. Every "modifying" operation
/// returns a new Value; untouched subtrees are shared by reference through
/// immer::box, so rebuilding a path from a leaf to the root costs
/// O(depth) and never deep-copies siblings.
///
/// Whether a container behaves as an array or an object is NOT decided by
/// the variant alternative alone; see value_shape.h.

#pragma once

#include "treepatch_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace treepatch {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_op_error(
    std::string_view func,
    std::size_t op_index,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] operation #" << op_index << ": " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)op_index;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

/// Single-threaded memory policy: non-atomic refcount + no locks
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

struct Value;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueVector = immer::flex_vector<ValueBox, memory_policy>;

// ============================================================
// ValueMap - insertion-ordered immutable mapping
//
// Lookup goes through an immer::map index; iteration follows the
// order in which keys were first inserted. Overwriting an existing
// key keeps its position, erasing a key removes it from the order.
// ============================================================

class TREEPATCH_API ValueMap
{
public:
    using index_type = immer::map<std::string,
                                  ValueBox,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  memory_policy>;
    using order_type = immer::flex_vector<std::string, memory_policy>;
    using entry_type = std::pair<const std::string&, const ValueBox&>;

    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = entry_type;
        using difference_type   = std::ptrdiff_t;
        using reference         = entry_type;
        using pointer           = void;

        const_iterator() = default;
        const_iterator(order_type::const_iterator it, const index_type* index)
            : it_(std::move(it)), index_(index) {}

        reference operator*() const { return {*it_, *index_->find(*it_)}; }

        const_iterator& operator++()
        {
            ++it_;
            return *this;
        }

        const_iterator operator++(int)
        {
            auto tmp = *this;
            ++it_;
            return tmp;
        }

        friend bool operator==(const const_iterator& a, const const_iterator& b) { return a.it_ == b.it_; }

    private:
        order_type::const_iterator it_{};
        const index_type* index_ = nullptr;
    };

    ValueMap() = default;
    ValueMap(index_type index, order_type order)
        : index_(std::move(index)), order_(std::move(order)) {}

    [[nodiscard]] const ValueBox* find(const std::string& key) const { return index_.find(key); }
    [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

    /// Keys in insertion order
    [[nodiscard]] const order_type& keys() const noexcept { return order_; }

    [[nodiscard]] ValueMap set(const std::string& key, ValueBox val) const;
    [[nodiscard]] ValueMap erase(const std::string& key) const;

    [[nodiscard]] const_iterator begin() const { return {order_.begin(), &index_}; }
    [[nodiscard]] const_iterator end() const { return {order_.end(), &index_}; }

private:
    index_type index_;
    order_type order_;
};

// ============================================================
// Value
// ============================================================

struct TREEPATCH_API Value
{
    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 ValueMap,
                 ValueVector,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(std::in_place_type<bool>, v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) noexcept : data(std::in_place_type<int64_t>, static_cast<int64_t>(v)) {}

    Value(double v) noexcept : data(std::in_place_type<double>, v) {}
    Value(float v) noexcept : data(std::in_place_type<double>, static_cast<double>(v)) {}
    Value(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::in_place_type<ValueMap>, std::move(v)) {}
    Value(ValueVector v) : data(std::in_place_type<ValueVector>, std::move(v)) {}

    // Factory functions for container types
    static Value map(std::initializer_list<std::pair<std::string, Value>> init);
    static Value vector(std::initializer_list<Value> init);

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
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

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Member lookup on a ValueMap; null (and a log line) when absent
    [[nodiscard]] Value at(const std::string& key) const;

    /// Element lookup on a ValueVector; null (and a log line) when out of range
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->count(key) > 0;
        return false;
    }

    /// Number of members/elements; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// ValueMap out-of-line members (need a complete Value)
// ============================================================

inline ValueMap ValueMap::set(const std::string& key, ValueBox val) const
{
    auto order = index_.count(key) ? order_ : order_.push_back(key);
    return ValueMap{index_.set(key, std::move(val)), std::move(order)};
}

inline ValueMap ValueMap::erase(const std::string& key) const
{
    if (!index_.count(key)) {
        return *this;
    }
    std::size_t pos = 0;
    for (const auto& k : order_) {
        if (k == key) break;
        ++pos;
    }
    return ValueMap{index_.erase(key), order_.erase(pos)};
}

inline Value Value::map(std::initializer_list<std::pair<std::string, Value>> init)
{
    ValueMap result;
    for (const auto& [key, val] : init) {
        result = result.set(key, ValueBox{val});
    }
    return Value{std::move(result)};
}

inline Value Value::vector(std::initializer_list<Value> init)
{
    auto t = ValueVector{}.transient();
    for (const auto& val : init) {
        t.push_back(ValueBox{val});
    }
    return Value{t.persistent()};
}

inline Value Value::at(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) {
        if (auto* found = m->find(key)) return found->get();
    }
    detail::log_access_error("Value::at", "key '" + key + "' not found or type mismatch");
    return Value{};
}

inline Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
    }
    detail::log_access_error("Value::at", "index " + std::to_string(index) + " out of range or type mismatch");
    return Value{};
}

// ============================================================
// Raw structural equality
//
// Same alternative and same content; ValueMap members must appear in
// the same order and int64_t 1 differs from double 1.0. This is the
// strict comparison used by the diff engine. For RFC 6902 "test"
// semantics use considered_equal() from equality.h.
//
// Implemented with an explicit work stack, so arbitrarily deep trees
// are compared without recursion.
// ============================================================

[[nodiscard]] TREEPATCH_API bool operator==(const Value& a, const Value& b);

} // namespace treepatch
