// value_shape.cpp - Associativity classifier and shape helpers

#include <treepatch/value_shape.h>
#include <treepatch/builders.h>

#include <limits>
#include <vector>

namespace treepatch {

bool is_collection(const Value& v) noexcept
{
    return v.is_map() || v.is_vector();
}

std::size_t collection_size(const Value& v) noexcept
{
    return v.size();
}

bool is_index_token(std::string_view token) noexcept
{
    if (token.empty()) {
        return false;
    }
    if (token.size() > 1 && token[0] == '0') {
        return false;
    }
    for (char c : token) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

std::optional<std::size_t> parse_index(std::string_view token) noexcept
{
    if (!is_index_token(token)) {
        return std::nullopt;
    }
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    std::size_t result = 0;
    for (char c : token) {
        auto digit = static_cast<std::size_t>(c - '0');
        if (result > (max - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

bool is_associative(const Value& v)
{
    const auto* map = v.get_if<ValueMap>();
    if (!map || map->empty()) {
        return false;
    }
    // Unique keys: all of them being indices below size() means 0..n-1
    const auto n = map->size();
    for (const auto& key : map->keys()) {
        auto index = parse_index(key);
        if (!index || *index >= n) {
            return true;
        }
    }
    return false;
}

bool is_sequence_like(const Value& v)
{
    return is_collection(v) && !is_associative(v);
}

bool is_falsy(const Value& v)
{
    return std::visit([](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, bool>) {
            return !arg;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return arg == 0;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg.empty() || arg == "0";
        } else {
            return arg.size() == 0;
        }
    }, v.data);
}

ValueVector as_sequence(const Value& v)
{
    if (auto* vec = v.get_if<ValueVector>()) {
        return *vec;
    }
    const auto* map = v.get_if<ValueMap>();
    if (!map) {
        return {};
    }

    VectorBuilder builder;
    if (is_associative(v)) {
        for (const auto& [key, box] : *map) {
            builder.push_back_box(box);
        }
        return builder.finish_vector();
    }

    // Keys are a permutation of 0..n-1; lay them out by index
    std::vector<const ValueBox*> slots(map->size(), nullptr);
    for (const auto& [key, box] : *map) {
        slots[*parse_index(key)] = &box;
    }
    for (const auto* slot : slots) {
        builder.push_back_box(*slot);
    }
    return builder.finish_vector();
}

const Value* find_child(const Value& v, const std::string& token)
{
    if (auto* vec = v.get_if<ValueVector>()) {
        auto index = parse_index(token);
        if (!index || *index >= vec->size()) {
            return nullptr;
        }
        return &(*vec)[*index].get();
    }
    if (auto* map = v.get_if<ValueMap>()) {
        if (auto* found = map->find(token)) {
            return &found->get();
        }
    }
    return nullptr;
}

Value make_singleton(Value v)
{
    return VectorBuilder().push_back(std::move(v)).finish();
}

} // namespace treepatch
