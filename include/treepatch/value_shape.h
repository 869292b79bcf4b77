// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_shape.h
/// @brief Associativity classifier: is a container array-like or object-like?
///
/// A container's shape is derived from its current keys, never from a
/// stored tag:
///
/// - ValueVector                  -> sequence-like
/// - empty ValueMap               -> sequence-like ({} and [] are the same thing)
/// - ValueMap keyed "0".."n-1"    -> sequence-like, read by index
/// - any other non-empty ValueMap -> associative (object-like)
///
/// Gappy integer keys ({"0":a, "2":c}) and non-canonical numbers ("01")
/// make a map associative. The classifier is recomputed on every call:
/// the engine changes shapes between operations (adding "0" to {"1":x}
/// turns an object into an array) so nothing here is cached.

#pragma once

#include <treepatch/api.h>
#include <treepatch/value.h>

#include <optional>
#include <string_view>

namespace treepatch {

/// ValueMap or ValueVector
[[nodiscard]] TREEPATCH_API bool is_collection(const Value& v) noexcept;

/// Member/element count of a collection, 0 for scalars
[[nodiscard]] TREEPATCH_API std::size_t collection_size(const Value& v) noexcept;

/// True for "0" or a decimal number without a leading zero ("1e0", "01", "-1" are not)
[[nodiscard]] TREEPATCH_API bool is_index_token(std::string_view token) noexcept;

/// Parse an index token; nullopt when not an index or when it overflows std::size_t
[[nodiscard]] TREEPATCH_API std::optional<std::size_t> parse_index(std::string_view token) noexcept;

/// Object-like? False for scalars and for empty collections.
[[nodiscard]] TREEPATCH_API bool is_associative(const Value& v);

/// Array-like collection (a collection that is not associative, empty included)
[[nodiscard]] TREEPATCH_API bool is_sequence_like(const Value& v);

/// null, false, 0, 0.0, "", "0" and empty collections
[[nodiscard]] TREEPATCH_API bool is_falsy(const Value& v);

/// Elements of a sequence-like collection in index order.
/// An associative map yields its values in insertion order; a scalar yields nothing.
[[nodiscard]] TREEPATCH_API ValueVector as_sequence(const Value& v);

/// Child addressed by a pointer token: index into a ValueVector, key into a ValueMap.
/// Returns nullptr when the child does not exist or v is not a collection.
/// The pointer stays valid as long as v is alive.
[[nodiscard]] TREEPATCH_API const Value* find_child(const Value& v, const std::string& token);

/// [v]
[[nodiscard]] TREEPATCH_API Value make_singleton(Value v);

} // namespace treepatch
