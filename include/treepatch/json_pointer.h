// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) codec.
///
///   "/users/0/name"  ->  ["users", "0", "name"]
///   ""               ->  []     (the whole document)
///   "/"              ->  [""]   (key is the empty string)
///
/// Tokens stay strings. Whether "0" means an index or a key is decided
/// at the container it is applied to, not here.
///
/// Escape sequences: "~1" -> "/", "~0" -> "~" (decoded in that order, so
/// "~01" is the literal key "~1").

#pragma once

#include <treepatch/api.h>
#include <treepatch/errors.h>

#include <string>
#include <string_view>
#include <vector>

namespace treepatch {

using Tokens = std::vector<std::string>;

struct PointerResult {
    Tokens tokens;
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
};

/// Split a pointer into unescaped tokens; MalformedPointer when a non-empty
/// pointer does not start with '/'
[[nodiscard]] TREEPATCH_API PointerResult decompose_pointer(std::string_view pointer);

/// Inverse of decompose_pointer()
[[nodiscard]] TREEPATCH_API std::string compose_pointer(const Tokens& tokens);

/// "~" -> "~0", then "/" -> "~1"
[[nodiscard]] TREEPATCH_API std::string escape_pointer_part(std::string_view token);

/// "~1" -> "/", then "~0" -> "~"
[[nodiscard]] TREEPATCH_API std::string unescape_pointer_part(std::string_view token);

/// Append one escaped token to a pointer string
TREEPATCH_API void append_pointer_part(std::string& pointer, std::string_view token);

} // namespace treepatch
