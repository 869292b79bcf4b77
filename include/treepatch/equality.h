// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file equality.h
/// @brief Semantic equality used by the "test" operation and the fixture harness.
///
/// Two values are considered equal when their canonical forms are equal:
/// - object-like maps compare by key set, member order is irrelevant
/// - array-like collections compare element by element in index order,
///   so {} equals [] and {"0": x} equals [x]
/// - numbers compare by value: 1 equals 1.0
///
/// Raw operator== (value.h) is stricter on all three points.

#pragma once

#include <treepatch/api.h>
#include <treepatch/value.h>

namespace treepatch {

[[nodiscard]] TREEPATCH_API bool considered_equal(const Value& a, const Value& b);

/// Object-like maps rebuilt with keys in byte order, array-like collections
/// turned into ValueVector, integral doubles that fit int64_t turned into
/// integers. canonical_form(a) == canonical_form(b) iff considered_equal(a, b).
[[nodiscard]] TREEPATCH_API Value canonical_form(const Value& v);

} // namespace treepatch
