// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value.
///
/// Usage:
/// @code
///   #include <treepatch/serialization.h>
///
///   std::string error;
///   Value doc = from_json(R"({"a": [1, 2.5, "x"]})", &error);
///   std::string text = to_json(doc);        // pretty-printed
///   std::string line = to_json(doc, true);  // compact
/// @endcode
///
/// Object members are written in insertion order. Integers that fit in
/// int64_t are read as int64_t, every other number as double. A double is
/// always written with a fraction or exponent so that it reads back as a
/// double; NaN and infinities are written as null.

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace treepatch {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
TREEPATCH_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON text to Value
/// @param json_str The JSON text
/// @param error_out If provided, receives the error message on failure
/// @return Parsed Value, or null Value on parse error (trailing content and
///         nesting deeper than TREEPATCH_MAX_DEPTH are errors)
TREEPATCH_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

} // namespace treepatch
