// patch_op.cpp - Operation decoding and encoding

#include <treepatch/patch_op.h>
#include <treepatch/builders.h>
#include <treepatch/serialization.h>
#include <treepatch/value_shape.h>

#include <algorithm>
#include <array>
#include <utility>

namespace treepatch {

namespace {

constexpr std::array<std::pair<OpKind, std::string_view>, 7> kOpNames{{
    {OpKind::Add, "add"},
    {OpKind::Remove, "remove"},
    {OpKind::Replace, "replace"},
    {OpKind::Move, "move"},
    {OpKind::Copy, "copy"},
    {OpKind::Test, "test"},
    {OpKind::Append, "append"},
}};

OpParseResult parse_failure(PatchErrorCode code, std::string what, const Value& op_value)
{
    OpParseResult result;
    result.error_code = code;
    result.error_message = std::move(what) + " in " + to_json(op_value, true);
    return result;
}

} // anonymous namespace

std::string_view op_kind_name(OpKind kind) noexcept
{
    for (const auto& [k, name] : kOpNames) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<OpKind> parse_op_kind(std::string_view name) noexcept
{
    for (const auto& [kind, n] : kOpNames) {
        if (n == name) {
            return kind;
        }
    }
    return std::nullopt;
}

bool op_needs_value(OpKind kind) noexcept
{
    return kind == OpKind::Add || kind == OpKind::Replace || kind == OpKind::Test || kind == OpKind::Append;
}

bool op_needs_from(OpKind kind) noexcept
{
    return kind == OpKind::Move || kind == OpKind::Copy;
}

// ============================================================
// PatchOp factories
// ============================================================

PatchOp PatchOp::add(Tokens path, Value value)
{
    return PatchOp{OpKind::Add, std::move(path), std::move(value), {}};
}

PatchOp PatchOp::remove(Tokens path)
{
    return PatchOp{OpKind::Remove, std::move(path), std::nullopt, {}};
}

PatchOp PatchOp::replace(Tokens path, Value value)
{
    return PatchOp{OpKind::Replace, std::move(path), std::move(value), {}};
}

PatchOp PatchOp::move(Tokens from, Tokens path)
{
    return PatchOp{OpKind::Move, std::move(path), std::nullopt, std::move(from)};
}

PatchOp PatchOp::copy(Tokens from, Tokens path)
{
    return PatchOp{OpKind::Copy, std::move(path), std::nullopt, std::move(from)};
}

PatchOp PatchOp::test(Tokens path, Value value)
{
    return PatchOp{OpKind::Test, std::move(path), std::move(value), {}};
}

PatchOp PatchOp::append(Tokens path, Value value)
{
    return PatchOp{OpKind::Append, std::move(path), std::move(value), {}};
}

bool operator==(const PatchOp& a, const PatchOp& b)
{
    if (a.kind != b.kind || a.path != b.path || a.value.has_value() != b.value.has_value()) {
        return false;
    }
    if (a.value && !(*a.value == *b.value)) {
        return false;
    }
    return !op_needs_from(a.kind) || a.from == b.from;
}

// ============================================================
// Decoding
// ============================================================

OpParseResult parse_operation(const Value& op_value)
{
    const Value* op = find_child(op_value, "op");
    if (!op || is_falsy(*op)) {
        return parse_failure(PatchErrorCode::MissingField, "'op' missing", op_value);
    }

    const Value* path = find_child(op_value, "path");
    if (!path || !path->is_string()) {
        return parse_failure(PatchErrorCode::MissingField, "'path' missing", op_value);
    }

    auto kind = op->is_string() ? parse_op_kind(op->as_string_view()) : std::nullopt;
    if (!kind) {
        return parse_failure(PatchErrorCode::UnrecognizedOp, "unrecognized op", op_value);
    }

    auto path_tokens = decompose_pointer(path->as_string_view());
    if (!path_tokens) {
        return parse_failure(path_tokens.error_code, path_tokens.error_message, op_value);
    }

    OpParseResult result;
    result.op.kind = *kind;
    result.op.path = std::move(path_tokens.tokens);

    if (op_needs_value(*kind)) {
        const Value* value = find_child(op_value, "value");
        if (!value) {
            return parse_failure(PatchErrorCode::MissingField, "'value' missing", op_value);
        }
        result.op.value = *value;
    }

    if (op_needs_from(*kind)) {
        const Value* from = find_child(op_value, "from");
        if (!from || !from->is_string()) {
            return parse_failure(PatchErrorCode::MissingField, "'from' missing", op_value);
        }
        auto from_tokens = decompose_pointer(from->as_string_view());
        if (!from_tokens) {
            return parse_failure(from_tokens.error_code, from_tokens.error_message, op_value);
        }
        result.op.from = std::move(from_tokens.tokens);
    }

    result.success = true;
    return result;
}

ValueVector operation_list(const Value& patch)
{
    if (!is_collection(patch)) {
        return {};
    }
    if (collection_size(patch) != 0 && !find_child(patch, "0")) {
        return ValueVector{}.push_back(ValueBox{patch});
    }
    return as_sequence(patch);
}

// ============================================================
// Encoding
// ============================================================

Value operation_to_value(const PatchOp& op)
{
    MapBuilder builder;
    builder.set("op", std::string{op_kind_name(op.kind)});
    if (op_needs_from(op.kind)) {
        builder.set("from", compose_pointer(op.from));
    }
    builder.set("path", compose_pointer(op.path));
    if (op.value) {
        builder.set("value", *op.value);
    }
    return builder.finish();
}

Value operations_to_value(const std::vector<PatchOp>& ops)
{
    VectorBuilder builder;
    for (const auto& op : ops) {
        builder.push_back(operation_to_value(op));
    }
    return builder.finish();
}

std::vector<PatchOp> reverse_operations(std::vector<PatchOp> ops)
{
    std::reverse(ops.begin(), ops.end());
    return ops;
}

} // namespace treepatch
