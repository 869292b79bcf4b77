// value_diff.cpp - Patch generation

#include <treepatch/value_diff.h>
#include <treepatch/value_shape.h>

#include <algorithm>

namespace treepatch {

namespace {

bool has_index_key(const ValueMap& map)
{
    return std::any_of(map.keys().begin(), map.keys().end(),
                       [](const std::string& key) { return is_index_token(key); });
}

bool same_keys(const ValueMap& a, const ValueMap& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    return std::all_of(a.keys().begin(), a.keys().end(),
                       [&](const std::string& key) { return b.count(key) > 0; });
}

/// Collects operations in reverse application order; diff() flips them.
class PatchCollector
{
public:
    std::vector<PatchOp> take()
    {
        std::reverse(ops_.begin(), ops_.end());
        return std::move(ops_);
    }

    void diff_value(const Value& a, const Value& b, Tokens& path);

private:
    void diff_assoc(const Value& src, const Value& dst, Tokens& path);
    void diff_array(const Value& src, const Value& dst, Tokens& path);

    void emit_replace(const Tokens& path, const Value& value)
    {
        ops_.push_back(PatchOp::replace(path, value));
    }

    std::vector<PatchOp> ops_;
};

void PatchCollector::diff_value(const Value& a, const Value& b, Tokens& path)
{
    if (&a == &b) {
        return;
    }

    if (path.size() >= TREEPATCH_MAX_DEPTH) [[unlikely]] {
        if (!(a == b)) {
            emit_replace(path, b);
        }
        return;
    }

    const bool a_assoc = is_associative(a);
    const bool b_assoc = is_associative(b);

    if (((is_falsy(a) || is_falsy(b)) && (a_assoc || b_assoc)) || (a_assoc && b_assoc)) {
        diff_assoc(a, b, path);
    } else if (is_sequence_like(a) && is_sequence_like(b)) {
        diff_array(a, b, path);
    } else if (!(a == b)) {
        emit_replace(path, b);
    }
}

void PatchCollector::diff_assoc(const Value& src, const Value& dst, Tokens& path)
{
    if (!is_collection(src) || !is_collection(dst)) {
        emit_replace(path, dst);
        return;
    }
    if (collection_size(src) == 0) {
        if (collection_size(dst) != 0) {
            emit_replace(path, dst);
        }
        return;
    }

    // src is a non-empty map here; dst is a map or an empty vector
    const auto& src_map = *src.get_if<ValueMap>();
    const auto* dst_map = dst.get_if<ValueMap>();

    // Adding or removing integer-like keys one at a time can turn the
    // intermediate object into an array and back; replace it whole instead.
    // An empty vector target counts as having no keys.
    const bool index_keys = has_index_key(src_map) || (dst_map && has_index_key(*dst_map));
    if (index_keys && !(dst_map && same_keys(src_map, *dst_map))) {
        emit_replace(path, dst);
        return;
    }

    // Collected in reverse application order: removals/recursions in src
    // key order, then additions in dst key order
    for (const auto& key : src_map.keys()) {
        path.push_back(key);
        const ValueBox* other = dst_map ? dst_map->find(key) : nullptr;
        if (other) {
            diff_value(src_map.find(key)->get(), other->get(), path);
        } else {
            ops_.push_back(PatchOp::remove(path));
        }
        path.pop_back();
    }

    if (dst_map) {
        for (const auto& key : dst_map->keys()) {
            if (src_map.count(key) == 0) {
                path.push_back(key);
                ops_.push_back(PatchOp::add(path, dst_map->find(key)->get()));
                path.pop_back();
            }
        }
    }
}

void PatchCollector::diff_array(const Value& src, const Value& dst, Tokens& path)
{
    const auto src_seq = as_sequence(src);
    const auto dst_seq = as_sequence(dst);
    const std::size_t src_size = src_seq.size();
    const std::size_t dst_size = dst_seq.size();
    const std::size_t max_size = std::max(src_size, dst_size);

    for (std::size_t n = max_size; n > 0; --n) {
        const std::size_t i = n - 1;
        if (i < src_size && i < dst_size) {
            path.push_back(std::to_string(i));
            diff_value(src_seq[i].get(), dst_seq[i].get(), path);
            path.pop_back();
        } else if (i < dst_size) {
            path.push_back(std::to_string(i));
            ops_.push_back(PatchOp::add(path, dst_seq[i].get()));
            path.pop_back();
        } else {
            // Surplus elements are removed from the first surplus position:
            // each removal shifts the rest of the tail down onto it
            path.push_back(std::to_string(dst_size));
            ops_.push_back(PatchOp::remove(path));
            path.pop_back();
        }
    }
}

} // anonymous namespace

std::vector<PatchOp> diff(const Value& src, const Value& dst)
{
    PatchCollector collector;
    Tokens path;
    path.reserve(16);
    collector.diff_value(src, dst, path);
    return collector.take();
}

} // namespace treepatch
