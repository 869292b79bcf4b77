// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_op.h
/// @brief Patch operations: the RFC 6902 kinds plus "append".
///
/// A PatchOp is the decoded form of one operation object:
///
///   {"op": "add",  "path": "/a/0", "value": 1}
///   {"op": "move", "path": "/b",   "from": "/a"}
///
/// Pointers are kept as token lists, so an operation built by diff() and
/// one parsed from a document are applied by the same code.

#pragma once

#include <treepatch/api.h>
#include <treepatch/errors.h>
#include <treepatch/json_pointer.h>
#include <treepatch/value.h>

#include <optional>
#include <string_view>
#include <vector>

namespace treepatch {

enum class OpKind {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test,
    Append, // Non-standard: splice the elements of value into an array
};

/// "add", "remove", ...
[[nodiscard]] TREEPATCH_API std::string_view op_kind_name(OpKind kind) noexcept;

/// Inverse of op_kind_name(); nullopt for anything else (matching is exact)
[[nodiscard]] TREEPATCH_API std::optional<OpKind> parse_op_kind(std::string_view name) noexcept;

/// Kinds that carry a "value" member
[[nodiscard]] TREEPATCH_API bool op_needs_value(OpKind kind) noexcept;

/// Kinds that carry a "from" member
[[nodiscard]] TREEPATCH_API bool op_needs_from(OpKind kind) noexcept;

struct TREEPATCH_API PatchOp {
    OpKind kind = OpKind::Add;
    Tokens path;
    std::optional<Value> value; // set for Add, Replace, Test and Append
    Tokens from;                // meaningful for Move and Copy

    static PatchOp add(Tokens path, Value value);
    static PatchOp remove(Tokens path);
    static PatchOp replace(Tokens path, Value value);
    static PatchOp move(Tokens from, Tokens path);
    static PatchOp copy(Tokens from, Tokens path);
    static PatchOp test(Tokens path, Value value);
    static PatchOp append(Tokens path, Value value);
};

[[nodiscard]] TREEPATCH_API bool operator==(const PatchOp& a, const PatchOp& b);

struct OpParseResult {
    PatchOp op;
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
};

/// Decode one operation object.
///
/// Checked in this order: "op" present and non-empty (MissingField),
/// "path" a string (MissingField), "op" one of the seven kinds
/// (UnrecognizedOp), "path" well formed (MalformedPointer), "value"
/// present when required (MissingField), "from" present and a string when
/// required (MissingField), "from" well formed (MalformedPointer).
[[nodiscard]] TREEPATCH_API OpParseResult parse_operation(const Value& op_value);

/// Operation list of a patch document, in application order. A single
/// operation object (a non-empty object without a "0" member) is treated as
/// a list of one; a scalar yields nothing.
[[nodiscard]] TREEPATCH_API ValueVector operation_list(const Value& patch);

/// RFC 6902 object form: {"op", "path", "value"?, "from"?}
[[nodiscard]] TREEPATCH_API Value operation_to_value(const PatchOp& op);

/// Array of operation_to_value() results
[[nodiscard]] TREEPATCH_API Value operations_to_value(const std::vector<PatchOp>& ops);

/// Same operations, last first
[[nodiscard]] TREEPATCH_API std::vector<PatchOp> reverse_operations(std::vector<PatchOp> ops);

} // namespace treepatch
