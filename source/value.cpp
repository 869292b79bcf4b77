// value.cpp - Value equality

#include <treepatch/value.h>

#include <vector>

namespace treepatch {

namespace {

/// Compare two non-container alternatives (same index already checked)
bool scalars_equal(const Value& a, const Value& b)
{
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueVector>) {
            return false;  // containers are expanded by the caller
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            return lhs == std::get<T>(b.data);
        }
    }, a.data);
}

} // anonymous namespace

bool operator==(const Value& a, const Value& b)
{
    std::vector<std::pair<const Value*, const Value*>> pending;
    pending.reserve(16);
    pending.emplace_back(&a, &b);

    while (!pending.empty()) {
        auto [lhs, rhs] = pending.back();
        pending.pop_back();

        // Shared subtree (same box) - nothing to compare
        if (lhs == rhs) {
            continue;
        }
        if (lhs->data.index() != rhs->data.index()) {
            return false;
        }

        if (auto* lmap = lhs->get_if<ValueMap>()) {
            const auto& rmap = std::get<ValueMap>(rhs->data);
            if (lmap->size() != rmap.size()) {
                return false;
            }
            auto rit = rmap.begin();
            for (const auto& [key, box] : *lmap) {
                const auto& [rkey, rbox] = *rit;
                if (key != rkey) {
                    return false;
                }
                pending.emplace_back(&box.get(), &rbox.get());
                ++rit;
            }
        } else if (auto* lvec = lhs->get_if<ValueVector>()) {
            const auto& rvec = std::get<ValueVector>(rhs->data);
            if (lvec->size() != rvec.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lvec->size(); ++i) {
                pending.emplace_back(&(*lvec)[i].get(), &rvec[i].get());
            }
        } else if (!scalars_equal(*lhs, *rhs)) {
            return false;
        }
    }
    return true;
}

} // namespace treepatch
