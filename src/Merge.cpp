/**
 * @file Merge.cpp
 * @brief Implementation of merge_into and merge
 */

#include "paramtree/Merge.hpp"

#include <iterator>

namespace paramtree {

Object merge_into(Value value, Object existing) {
    if (!value.is_object()) {
        throw MergeError("object", type_name(value));
    }

    for (auto& [key, child] : value.as_object()) {
        existing[key] = std::move(child);
    }
    return existing;
}

Value merge(Value a, Value b) {
    // Null doesn't override, and is overridden by anything
    if (b.is_null()) {
        return a;
    }
    if (a.is_null()) {
        return b;
    }

    if (a.is_object() && b.is_object()) {
        return Value(merge_into(std::move(b), std::move(a.as_object())));
    }

    if (a.is_array() && b.is_array()) {
        Array& left = a.as_array();
        Array& right = b.as_array();
        left.insert(left.end(), std::make_move_iterator(right.begin()),
                    std::make_move_iterator(right.end()));
        return a;
    }

    if (a.is_array()) {
        a.as_array().push_back(std::move(b));
        return a;
    }

    if (b.is_array()) {
        Array& right = b.as_array();
        right.insert(right.begin(), std::move(a));
        return b;
    }

    throw MergeError(type_name(a), type_name(b));
}

} // namespace paramtree
