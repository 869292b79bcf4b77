// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.cpp
/// @brief Patch engine: pointer descent, final-token edits, parent rebuild.

#include <treepatch/patch.h>
#include <treepatch/equality.h>
#include <treepatch/value_shape.h>

namespace treepatch {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

using StepResult = std::pair<Value, PatchErrorCode>;

StepResult step_fail(PatchErrorCode code)
{
    return {Value{}, code};
}

StepResult step_ok(Value v)
{
    return {std::move(v), PatchErrorCode::Success};
}

bool promotes_next(const std::string& next_token)
{
    return next_token == "0" || next_token == "1" || next_token == "-";
}

/// Write `child` back under `token`; the token was resolved on the way down
Value set_child(const Value& parent, const std::string& token, Value child)
{
    if (auto* vec = parent.get_if<ValueVector>()) {
        return vec->set(*parse_index(token), ValueBox{std::move(child)});
    }
    return parent.get_if<ValueMap>()->set(token, ValueBox{std::move(child)});
}

/// Elements spliced in by "append": the members of a collection, or the value itself
ValueVector append_elements(const Value& value)
{
    if (is_collection(value)) {
        return as_sequence(value);
    }
    return ValueVector{}.push_back(ValueBox{value});
}

StepResult splice(const Value& target, const std::string& token, OpKind kind, const Value* value)
{
    auto seq = as_sequence(target);
    const std::size_t len = seq.size();

    std::size_t pos = len;
    if (token != "-") {
        auto index = parse_index(token);
        if (!index) {
            return step_fail(PatchErrorCode::OutOfBounds);
        }
        pos = *index;
    }

    const bool in_bounds = kind == OpKind::Remove ? pos < len : pos <= len;
    if (!in_bounds) {
        return step_fail(PatchErrorCode::OutOfBounds);
    }

    switch (kind) {
        case OpKind::Add:
            return step_ok(seq.insert(pos, ValueBox{*value}));
        case OpKind::Append:
            return step_ok(seq.take(pos) + append_elements(*value) + seq.drop(pos));
        case OpKind::Replace:
            if (pos == len) {
                return step_ok(seq.push_back(ValueBox{*value}));
            }
            return step_ok(seq.set(pos, ValueBox{*value}));
        case OpKind::Remove:
            return step_ok(seq.erase(pos));
        default:
            return step_fail(PatchErrorCode::UnrecognizedOp);
    }
}

StepResult set_member(const Value& target, const std::string& token, OpKind kind, const Value* value)
{
    // An empty vector takes string keys by becoming a map
    const ValueMap map = target.is_map() ? *target.get_if<ValueMap>() : ValueMap{};

    switch (kind) {
        case OpKind::Add:
        case OpKind::Append:
            return step_ok(map.set(token, ValueBox{*value}));
        case OpKind::Replace:
            if (!map.count(token)) {
                return step_fail(PatchErrorCode::PathNotFound);
            }
            return step_ok(map.set(token, ValueBox{*value}));
        case OpKind::Remove:
            if (!map.count(token)) {
                return step_fail(PatchErrorCode::PathNotFound);
            }
            return step_ok(map.erase(token));
        default:
            return step_fail(PatchErrorCode::UnrecognizedOp);
    }
}

/// Edit `target` at its member `token`
StepResult apply_final(const Value& target, const std::string& token, OpKind kind, const Value* value)
{
    if (!is_collection(target)) {
        return step_fail(PatchErrorCode::PathNotFound);
    }
    if (is_associative(target)) {
        return set_member(target, token, kind, value);
    }

    const bool adds = kind == OpKind::Add || kind == OpKind::Append;
    const bool splice_token = is_index_token(token) || (token == "-" && adds);
    if (splice_token) {
        return splice(target, token, kind, value);
    }
    if (collection_size(target) != 0) {
        return step_fail(PatchErrorCode::InvalidKeyForContainer);
    }
    return set_member(target, token, kind, value);
}

/// Add, Append, Replace or Remove at `tokens`.
/// Walks down collecting the parent chain, edits the last container, then
/// rebuilds the chain bottom-up.
StepResult do_op(const Value& doc, OpKind kind, const Tokens& tokens, const Value* value, Mode mode)
{
    if (tokens.size() > TREEPATCH_MAX_DEPTH) {
        return step_fail(PatchErrorCode::DepthLimitExceeded);
    }
    if (tokens.empty()) {
        if (kind == OpKind::Add || kind == OpKind::Replace) {
            return step_ok(*value);
        }
        return step_fail(PatchErrorCode::InvalidRootOperation);
    }

    std::vector<Value> parents;
    parents.reserve(tokens.size());
    Value current = doc;

    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        const Value* child = find_child(current, tokens[i]);
        if (!child) {
            return step_fail(PatchErrorCode::PathNotFound);
        }
        Value next = (mode == Mode::SimpleXml && promotes_next(tokens[i + 1]) &&
                      detail::should_promote(current, *child))
                         ? make_singleton(*child)
                         : *child;
        parents.push_back(std::move(current));
        current = std::move(next);
    }

    auto [result, code] = apply_final(current, tokens.back(), kind, value);
    if (code != PatchErrorCode::Success) {
        return step_fail(code);
    }

    for (std::size_t i = parents.size(); i > 0; --i) {
        result = set_child(parents[i - 1], tokens[i - 1], std::move(result));
    }
    return step_ok(std::move(result));
}

std::string reason(PatchErrorCode code)
{
    switch (code) {
        case PatchErrorCode::PathNotFound:           return "path not found";
        case PatchErrorCode::InvalidKeyForContainer: return "key is not an array index";
        case PatchErrorCode::OutOfBounds:            return "index out of bounds";
        case PatchErrorCode::InvalidRootOperation:   return "operation not allowed on the whole document";
        case PatchErrorCode::DepthLimitExceeded:     return "pointer nesting limit exceeded";
        default:                                     return std::string{error_code_name(code)};
    }
}

PatchResult op_failure(const PatchOp& op, const Tokens& tokens, PatchErrorCode code)
{
    return PatchResult::fail(code, std::string{op_kind_name(op.kind)} + " \"" + compose_pointer(tokens) +
                                       "\": " + reason(code));
}

PatchResult collapse_impl(const Value& node, std::size_t depth, bool& changed)
{
    if (depth > TREEPATCH_MAX_DEPTH) {
        return PatchResult::fail(PatchErrorCode::DepthLimitExceeded, "document nesting limit exceeded");
    }
    if (!is_collection(node)) {
        return PatchResult::ok(node);
    }

    if (collection_size(node) == 1) {
        if (const Value* only = find_child(node, "0")) {
            changed = true;
            return collapse_impl(*only, depth + 1, changed);
        }
    }

    if (auto* vec = node.get_if<ValueVector>()) {
        ValueVector out = *vec;
        for (std::size_t i = 0; i < vec->size(); ++i) {
            bool child_changed = false;
            auto child = collapse_impl((*vec)[i].get(), depth + 1, child_changed);
            if (!child) {
                return child;
            }
            if (child_changed) {
                out = out.set(i, ValueBox{std::move(child.value)});
                changed = true;
            }
        }
        return PatchResult::ok(Value{std::move(out)});
    }

    const auto& map = *node.get_if<ValueMap>();
    ValueMap out = map;
    for (const auto& [key, box] : map) {
        bool child_changed = false;
        auto child = collapse_impl(box.get(), depth + 1, child_changed);
        if (!child) {
            return child;
        }
        if (child_changed) {
            out = out.set(key, ValueBox{std::move(child.value)});
            changed = true;
        }
    }
    return PatchResult::ok(Value{std::move(out)});
}

} // anonymous namespace

// ============================================================
// Public API Implementation
// ============================================================

PatchResult apply_operation(const Value& doc, const PatchOp& op, Mode mode)
{
    const Value* value = op.value ? &*op.value : nullptr;
    if (op_needs_value(op.kind) && !value) {
        return PatchResult::fail(PatchErrorCode::MissingField,
                                 std::string{op_kind_name(op.kind)} + ": 'value' missing");
    }

    switch (op.kind) {
        case OpKind::Add:
        case OpKind::Append:
        case OpKind::Replace:
        case OpKind::Remove: {
            auto [result, code] = do_op(doc, op.kind, op.path, value, mode);
            if (code != PatchErrorCode::Success) {
                return op_failure(op, op.path, code);
            }
            return PatchResult::ok(std::move(result));
        }

        case OpKind::Test: {
            auto found = get(doc, op.path, mode);
            if (!found) {
                return found;
            }
            if (!considered_equal(found.value, *value)) {
                return PatchResult::fail(PatchErrorCode::TestFailed,
                                         "test \"" + compose_pointer(op.path) + "\": target value differs");
            }
            return PatchResult::ok(doc);
        }

        case OpKind::Move:
        case OpKind::Copy: {
            if (op.path.empty()) {
                return op_failure(op, op.path, PatchErrorCode::InvalidRootOperation);
            }
            if (op.from.empty()) {
                return op_failure(op, op.from, PatchErrorCode::InvalidRootOperation);
            }
            auto found = get(doc, op.from, mode);
            if (!found) {
                return found;
            }

            Value current = doc;
            if (op.kind == OpKind::Move) {
                auto [removed, code] = do_op(current, OpKind::Remove, op.from, nullptr, mode);
                if (code != PatchErrorCode::Success) {
                    return op_failure(op, op.from, code);
                }
                current = std::move(removed);
            }
            auto [added, code] = do_op(current, OpKind::Add, op.path, &found.value, mode);
            if (code != PatchErrorCode::Success) {
                return op_failure(op, op.path, code);
            }
            return PatchResult::ok(std::move(added));
        }
    }
    return PatchResult::fail(PatchErrorCode::UnrecognizedOp, "unrecognized op");
}

PatchResult patch(const Value& doc, const std::vector<PatchOp>& ops, Mode mode)
{
    Value current = doc;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        auto step = apply_operation(current, ops[i], mode);
        if (!step) {
            detail::log_op_error("patch", i, step.error_message);
            step.failed_op_index = i;
            return step;
        }
        current = std::move(step.value);
    }

    if (mode == Mode::SimpleXml) {
        return collapse_singletons(current);
    }
    return PatchResult::ok(std::move(current));
}

PatchResult patch(const Value& doc, const Value& patch_value, Mode mode)
{
    if (!is_collection(patch_value)) {
        auto result = PatchResult::fail(PatchErrorCode::MissingField,
                                        "patch must be an operation or a list of operations");
        detail::log_op_error("patch", 0, result.error_message);
        return result;
    }

    const auto operations = operation_list(patch_value);
    Value current = doc;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto parsed = parse_operation(operations[i].get());
        if (!parsed) {
            detail::log_op_error("patch", i, parsed.error_message);
            return PatchResult::fail(parsed.error_code, std::move(parsed.error_message), i);
        }

        auto step = apply_operation(current, parsed.op, mode);
        if (!step) {
            detail::log_op_error("patch", i, step.error_message);
            step.failed_op_index = i;
            return step;
        }
        current = std::move(step.value);
    }

    if (mode == Mode::SimpleXml) {
        return collapse_singletons(current);
    }
    return PatchResult::ok(std::move(current));
}

PatchResult collapse_singletons(const Value& doc)
{
    bool changed = false;
    return collapse_impl(doc, 0, changed);
}

} // namespace treepatch
