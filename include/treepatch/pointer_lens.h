// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer_lens.h
/// @brief lager::lens<Value, Value> addressed by a JSON Pointer.
///
/// @code
///   auto name = pointer_lens("/users/0/name");
///   Value n   = lager::view(name, doc);
///   Value doc2 = lager::set(name, doc, Value{"Alicia"});
///   Value doc3 = lager::over(name, doc, [](Value v) { ... });
/// @endcode
///
/// view resolves the pointer like get() (null when it does not resolve).
/// set replaces the target when it exists and adds it otherwise; when
/// neither is possible the document comes back unchanged.

#pragma once

#include <treepatch/api.h>
#include <treepatch/json_pointer.h>
#include <treepatch/resolver.h>
#include <treepatch/value.h>

#include <lager/lens.hpp>

#include <string_view>

namespace treepatch {

using ValueLens = lager::lens<Value, Value>;

/// The empty pointer gives the identity lens; a malformed pointer views
/// null and ignores writes.
[[nodiscard]] TREEPATCH_API ValueLens pointer_lens(std::string_view pointer, Mode mode = Mode::Standard);

[[nodiscard]] TREEPATCH_API ValueLens pointer_lens(const Tokens& tokens, Mode mode = Mode::Standard);

} // namespace treepatch
