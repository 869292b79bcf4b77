// equality.cpp - considered_equal and canonical_form

#include <treepatch/equality.h>
#include <treepatch/builders.h>
#include <treepatch/value_shape.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace treepatch {

namespace {

/// Integral doubles inside the int64_t range become integers
Value normalize_scalar(const Value& v)
{
    if (auto* d = v.get_if<double>()) {
        if (std::isfinite(*d) && std::trunc(*d) == *d &&
            *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return Value{static_cast<int64_t>(*d)};
        }
    }
    return v;
}

bool scalars_considered_equal(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        return normalize_scalar(a) == normalize_scalar(b);
    }
    return a == b;
}

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys(map.keys().begin(), map.keys().end());
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // anonymous namespace

bool considered_equal(const Value& a, const Value& b)
{
    std::vector<std::pair<const Value*, const Value*>> stack;
    // Holds array-like maps laid out by index while their elements are on the stack
    std::vector<ValueVector> keep_alive;
    stack.emplace_back(&a, &b);

    while (!stack.empty()) {
        auto [lhs, rhs] = stack.back();
        stack.pop_back();

        if (lhs == rhs) {
            continue;
        }

        const bool lhs_coll = is_collection(*lhs);
        const bool rhs_coll = is_collection(*rhs);
        if (lhs_coll != rhs_coll) {
            return false;
        }
        if (!lhs_coll) {
            if (!scalars_considered_equal(*lhs, *rhs)) {
                return false;
            }
            continue;
        }

        if (lhs->size() != rhs->size()) {
            return false;
        }
        const bool lhs_assoc = is_associative(*lhs);
        if (lhs_assoc != is_associative(*rhs)) {
            return false;
        }

        if (lhs_assoc) {
            const auto& lm = *lhs->get_if<ValueMap>();
            const auto& rm = *rhs->get_if<ValueMap>();
            for (const auto& [key, box] : lm) {
                const auto* other = rm.find(key);
                if (!other) {
                    return false;
                }
                stack.emplace_back(&box.get(), &other->get());
            }
            continue;
        }

        auto ls = as_sequence(*lhs);
        auto rs = as_sequence(*rhs);
        for (std::size_t i = 0; i < ls.size(); ++i) {
            stack.emplace_back(&ls[i].get(), &rs[i].get());
        }
        keep_alive.push_back(std::move(ls));
        keep_alive.push_back(std::move(rs));
    }
    return true;
}

Value canonical_form(const Value& v)
{
    if (!is_collection(v)) {
        return normalize_scalar(v);
    }

    // Post-order walk: a frame is finished once all its children are canonical
    struct Frame {
        const Value* node;
        bool associative;
        std::vector<std::string> keys;  // sorted, object-like only
        ValueVector elements;           // index order, array-like only
        std::size_t next = 0;
        std::vector<Value> done;
    };

    auto make_frame = [](const Value& node) {
        Frame frame{&node, is_associative(node), {}, {}, 0, {}};
        if (frame.associative) {
            frame.keys = sorted_keys(*node.get_if<ValueMap>());
        } else {
            frame.elements = as_sequence(node);
        }
        return frame;
    };

    auto finish = [](Frame& frame) -> Value {
        if (frame.associative) {
            MapBuilder builder;
            for (std::size_t i = 0; i < frame.keys.size(); ++i) {
                builder.set(frame.keys[i], std::move(frame.done[i]));
            }
            return builder.finish();
        }
        VectorBuilder builder;
        for (auto& element : frame.done) {
            builder.push_back(std::move(element));
        }
        return builder.finish();
    };

    std::vector<Frame> stack;
    stack.push_back(make_frame(v));
    Value result;

    while (!stack.empty()) {
        auto& frame = stack.back();
        const std::size_t count = frame.associative ? frame.keys.size() : frame.elements.size();

        if (frame.next == count) {
            Value built = finish(frame);
            stack.pop_back();
            if (stack.empty()) {
                result = std::move(built);
            } else {
                stack.back().done.push_back(std::move(built));
                ++stack.back().next;
            }
            continue;
        }

        const Value& child = frame.associative
            ? frame.node->get_if<ValueMap>()->find(frame.keys[frame.next])->get()
            : frame.elements[frame.next].get();

        if (is_collection(child)) {
            // May reallocate the stack; `frame` is not used after this
            stack.push_back(make_frame(child));
        } else {
            frame.done.push_back(normalize_scalar(child));
            ++frame.next;
        }
    }
    return result;
}

} // namespace treepatch
