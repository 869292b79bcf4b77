// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Error codes and result type shared by get() and patch().
///
/// Failures are reported as values, never by leaving a half-built tree
/// behind: a failed PatchResult carries no replacement document, so the
/// caller's input stays the only valid one.

#pragma once

#include <treepatch/api.h>
#include <treepatch/value.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace treepatch {

enum class PatchErrorCode {
    Success = 0,
    MalformedPointer,       // Pointer is non-empty and does not start with '/'
    MissingField,           // 'op', 'path', 'value' or 'from' absent from an operation
    UnrecognizedOp,         // 'op' is not one of the seven known kinds
    PathNotFound,           // Traversal hit an absent key/index or a non-container
    InvalidKeyForContainer, // Non-index token used on an array-like container
    OutOfBounds,            // Index outside the range allowed for the operation
    InvalidRootOperation,   // remove/move/copy/append aimed at the whole document
    TestFailed,             // 'test' value differs from the document
    DepthLimitExceeded,     // Pointer or document nesting beyond TREEPATCH_MAX_DEPTH
};

/// Stable identifier for an error code ("PathNotFound", ...)
[[nodiscard]] TREEPATCH_API std::string_view error_code_name(PatchErrorCode code) noexcept;

struct PatchResult {
    Value value;                    // The result (null on error)
    bool success = false;           // Whether the call succeeded
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;      // Human-readable error description
    std::size_t failed_op_index = 0; // Index of the failing operation (patch only)

    explicit operator bool() const noexcept { return success; }

    const Value& get() const {
        if (!success) {
            throw std::runtime_error("treepatch: " + error_message);
        }
        return value;
    }

    Value get_or(Value default_val) const {
        return success ? value : std::move(default_val);
    }

    static PatchResult ok(Value v) {
        PatchResult result;
        result.value = std::move(v);
        result.success = true;
        return result;
    }

    static PatchResult fail(PatchErrorCode code, std::string message, std::size_t op_index = 0) {
        PatchResult result;
        result.error_code = code;
        result.error_message = std::move(message);
        result.failed_op_index = op_index;
        return result;
    }
};

} // namespace treepatch
