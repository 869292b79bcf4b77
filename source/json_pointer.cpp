// json_pointer.cpp
// JSON Pointer (RFC 6901) parsing and formatting

#include <treepatch/json_pointer.h>

namespace treepatch {

namespace {

/// Replace every occurrence of `from` by `to`, left to right
std::string replace_all(std::string_view text, std::string_view from, std::string_view to)
{
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto hit = text.find(from, pos);
        if (hit == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, hit - pos));
        result.append(to);
        pos = hit + from.size();
    }
    return result;
}

} // anonymous namespace

std::string escape_pointer_part(std::string_view token)
{
    return replace_all(replace_all(token, "~", "~0"), "/", "~1");
}

std::string unescape_pointer_part(std::string_view token)
{
    // Two passes: "~01" must decode to "~1", not "/"
    return replace_all(replace_all(token, "~1", "/"), "~0", "~");
}

void append_pointer_part(std::string& pointer, std::string_view token)
{
    pointer += '/';
    for (char c : token) {
        if (c == '~') {
            pointer += "~0";
        } else if (c == '/') {
            pointer += "~1";
        } else {
            pointer += c;
        }
    }
}

PointerResult decompose_pointer(std::string_view pointer)
{
    PointerResult result;

    // Empty pointer refers to root
    if (pointer.empty()) {
        result.success = true;
        return result;
    }

    if (pointer[0] != '/') {
        result.error_code = PatchErrorCode::MalformedPointer;
        result.error_message = "pointer must be empty or start with '/': \"" + std::string(pointer) + "\"";
        detail::log_access_error("decompose_pointer", result.error_message);
        return result;
    }

    // Skip leading '/'; every '/' after it starts a new token, even a trailing one
    pointer.remove_prefix(1);
    while (true) {
        auto pos = pointer.find('/');
        result.tokens.push_back(unescape_pointer_part(pointer.substr(0, pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        pointer.remove_prefix(pos + 1);
    }

    result.success = true;
    return result;
}

std::string compose_pointer(const Tokens& tokens)
{
    std::string result;
    for (const auto& token : tokens) {
        append_pointer_part(result, token);
    }
    return result;
}

} // namespace treepatch
