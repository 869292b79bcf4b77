// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Apply patch operations to a document.
///
/// Every operation rebuilds only the chain of containers from the changed
/// node up to the root; all other subtrees are shared with the input.
/// A failing operation aborts the whole call: the result carries the
/// error and the index of the operation, and no partially patched document
/// is ever handed out.
///
/// ## Usage
/// @code
///   auto result = treepatch::patch(doc, from_json(R"([
///       {"op": "add", "path": "/tags/-", "value": "new"},
///       {"op": "test", "path": "/version", "value": 2}
///   ])"));
///   if (!result) {
///       std::cerr << result.error_message << "\n";
///   }
/// @endcode

#pragma once

#include <treepatch/api.h>
#include <treepatch/errors.h>
#include <treepatch/patch_op.h>
#include <treepatch/resolver.h>
#include <treepatch/value.h>

#include <vector>

namespace treepatch {

/// Apply `ops` in order
[[nodiscard]] TREEPATCH_API PatchResult patch(const Value& doc,
                                              const std::vector<PatchOp>& ops,
                                              Mode mode = Mode::Standard);

/// Apply a patch document: an array of operation objects, or a single one.
/// Each operation is decoded right before it is applied.
[[nodiscard]] TREEPATCH_API PatchResult patch(const Value& doc,
                                              const Value& patch_value,
                                              Mode mode = Mode::Standard);

/// Apply a single operation
[[nodiscard]] TREEPATCH_API PatchResult apply_operation(const Value& doc,
                                                        const PatchOp& op,
                                                        Mode mode = Mode::Standard);

/// Replace, bottom-up, every collection whose only element sits under
/// index 0 by that element: {"a": ["x"]} -> {"a": "x"}.
/// Run once after a patch in Mode::SimpleXml.
[[nodiscard]] TREEPATCH_API PatchResult collapse_singletons(const Value& doc);

} // namespace treepatch
