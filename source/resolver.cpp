// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resolver.cpp
/// @brief Pointer traversal for reads.

#include <treepatch/resolver.h>
#include <treepatch/value_shape.h>

namespace treepatch {

namespace detail {

bool should_promote(const Value& parent, const Value& child)
{
    return is_associative(parent) && !is_sequence_like(child);
}

} // namespace detail

PatchResult get(const Value& doc, const Tokens& tokens, Mode mode)
{
    if (tokens.size() > TREEPATCH_MAX_DEPTH) {
        auto result = PatchResult::fail(PatchErrorCode::DepthLimitExceeded,
                                        "pointer has " + std::to_string(tokens.size()) +
                                            " tokens, limit is " + std::to_string(TREEPATCH_MAX_DEPTH));
        detail::log_access_error("get", result.error_message);
        return result;
    }

    Value current = doc;
    std::string walked;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        append_pointer_part(walked, token);

        const Value* child = find_child(current, token);
        if (!child) [[unlikely]] {
            auto result = PatchResult::fail(PatchErrorCode::PathNotFound,
                                            "path \"" + walked + "\" not found");
            detail::log_access_error("get", result.error_message);
            return result;
        }

        if (mode == Mode::SimpleXml && i + 1 < tokens.size() && tokens[i + 1] == "0" &&
            detail::should_promote(current, *child)) {
            current = make_singleton(*child);
        } else {
            // child points into current; copy before current lets go of it
            Value next = *child;
            current = std::move(next);
        }
    }
    return PatchResult::ok(std::move(current));
}

PatchResult get(const Value& doc, std::string_view pointer, Mode mode)
{
    auto parsed = decompose_pointer(pointer);
    if (!parsed) {
        return PatchResult::fail(parsed.error_code, std::move(parsed.error_message));
    }
    return get(doc, parsed.tokens, mode);
}

} // namespace treepatch
