// value_diff.h - Patch generation between two Values

#pragma once

#include <treepatch/api.h>
#include <treepatch/patch_op.h>
#include <treepatch/value.h>

#include <vector>

namespace treepatch {

/// Operations that turn `src` into `dst`: patch(src, diff(src, dst)) is
/// considered equal to dst. Never fails; diff(a, a) is empty.
///
/// Object-like members are compared key by key, array-like collections
/// index by index (no move detection), everything else is replaced when
/// it differs. Subtrees nested deeper than TREEPATCH_MAX_DEPTH are
/// replaced as a whole.
[[nodiscard]] TREEPATCH_API std::vector<PatchOp> diff(const Value& src, const Value& dst);

} // namespace treepatch
