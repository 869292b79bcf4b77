// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resolver.h
/// @brief Read access to a document through a JSON Pointer.
///
/// ## Compatibility mode
///
/// Trees converted from XML by naive tools collapse a repeated element to
/// a scalar when it occurs only once: `<a><b>x</b></a>` becomes
/// `{"b": "x"}` but `<a><b>x</b><b>y</b></a>` becomes `{"b": ["x", "y"]}`.
/// With Mode::SimpleXml, "/b/0" still addresses "x" in the first tree:
/// a child of an object that is not itself array-like is read as if it
/// were wrapped in a one-element array.

#pragma once

#include <treepatch/api.h>
#include <treepatch/errors.h>
#include <treepatch/json_pointer.h>
#include <treepatch/value.h>

#include <string_view>

namespace treepatch {

enum class Mode {
    Standard,   // RFC 6901 / 6902 behaviour
    SimpleXml,  // Singleton promotion on read and write, collapse after patch
};

/// Value addressed by `tokens`. Fails with PathNotFound when a key or index
/// is absent or a step lands on a non-collection, and with
/// DepthLimitExceeded for pointers longer than TREEPATCH_MAX_DEPTH.
[[nodiscard]] TREEPATCH_API PatchResult get(const Value& doc, const Tokens& tokens, Mode mode = Mode::Standard);

/// Same as above, decoding the pointer first (MalformedPointer on bad syntax)
[[nodiscard]] TREEPATCH_API PatchResult get(const Value& doc, std::string_view pointer, Mode mode = Mode::Standard);

namespace detail {

/// Singleton promotion rule shared by the resolver and the patch engine:
/// `parent` is object-like and `child` is not array-like.
[[nodiscard]] TREEPATCH_API bool should_promote(const Value& parent, const Value& child);

} // namespace detail

} // namespace treepatch
