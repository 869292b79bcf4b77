// pointer_lens.cpp
// lager::lens<Value, Value> over the resolver and the patch engine

#include <treepatch/pointer_lens.h>
#include <treepatch/patch.h>

#include <lager/lenses.hpp>
#include <zug/compose.hpp>

namespace treepatch {

ValueLens pointer_lens(const Tokens& tokens, Mode mode)
{
    if (tokens.empty()) {
        return zug::identity;
    }

    return lager::lenses::getset(
        // Getter: resolve, null when absent
        [tokens, mode](const Value& root) -> Value {
            return get(root, tokens, mode).get_or(Value{});
        },
        // Setter: overwrite an existing target, otherwise create it
        [tokens, mode](Value root, Value new_val) -> Value {
            const auto kind = get(root, tokens, mode) ? OpKind::Replace : OpKind::Add;
            std::vector<PatchOp> ops{PatchOp{kind, tokens, std::move(new_val), {}}};
            auto result = patch(root, ops, mode);
            if (!result) {
                detail::log_access_error("pointer_lens", result.error_message);
                return root;
            }
            return std::move(result.value);
        });
}

ValueLens pointer_lens(std::string_view pointer, Mode mode)
{
    auto parsed = decompose_pointer(pointer);
    if (!parsed) {
        return lager::lenses::getset(
            [](const Value&) -> Value { return Value{}; },
            [](Value root, Value) -> Value { return root; });
    }
    return pointer_lens(parsed.tokens, mode);
}

} // namespace treepatch
