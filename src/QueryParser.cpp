/**
 * @file QueryParser.cpp
 * @brief Implementation of the nested bracket-key normalizer
 */

#include "paramtree/QueryParser.hpp"
#include "paramtree/KeyPath.hpp"
#include "paramtree/Util.hpp"

#include <string>

namespace paramtree {

Object QueryParser::parse_nested_query(std::string_view qs) const {
    Object params;
    parse_nested_query_into(params, qs);
    return params;
}

void QueryParser::parse_nested_query_into(Object& params, std::string_view qs) const {
    for (auto& [key, raw] : split_form_pairs(qs)) {
        Value v = raw ? Value::loose(std::move(*raw)) : Value();
        normalize(params, key, std::move(v), 0);
    }
}

void QueryParser::parse_nested_value(Object& params, std::string_view key, Value value) const {
    if (key.empty()) {
        return;
    }
    normalize(params, key, std::move(value), 0);
}

void QueryParser::check_depth(std::size_t depth) const {
    if (depth >= depth_limit_) {
        throw ParamsTooDeep(depth_limit_);
    }
}

std::optional<Value> QueryParser::normalize(Object& params, std::string_view name,
                                            Value v, std::size_t depth) const {
    check_depth(depth);

    auto [k, after] = split_key_head(name, depth == 0);

    if (k.empty()) {
        return Value();
    }

    if (after.empty()) {
        if (k == "[]" && depth != 0) {
            Array wrapped;
            wrapped.push_back(std::move(v));
            return Value(std::move(wrapped));
        }
        params[std::string(k)] = std::move(v);
        return std::nullopt;
    }

    if (after == "[") {
        params[std::string(name)] = std::move(v);
        return std::nullopt;
    }

    auto [it, inserted] = params.try_emplace(std::string(k));
    fold_tail(it->second, inserted, k, after, std::move(v), depth);
    return std::nullopt;
}

void QueryParser::fold_tail(Value& slot, bool fresh, std::string_view key,
                            std::string_view tail, Value v, std::size_t depth) const {
    // x[]
    if (tail == "[]") {
        if (fresh) slot = Value::array();
        if (!slot.is_array()) {
            throw ParameterTypeError(std::string(key), "array", type_name(slot));
        }
        slot.as_array().push_back(std::move(v));
        return;
    }

    // x[][y]: hash inside array
    if (starts_with(tail, "[]")) {
        std::string_view after = tail.substr(2);
        std::string_view child_key = after;
        if (after.size() >= 2 && after.front() == '[' && after.back() == ']') {
            std::string_view inner = after.substr(1, after.size() - 2);
            if (!inner.empty() && inner.find_first_of("[]") == std::string_view::npos) {
                child_key = inner;
            }
        }

        if (fresh) slot = Value::array();
        if (!slot.is_array()) {
            throw ParameterTypeError(std::string(key), "array", type_name(slot));
        }

        Array& arr = slot.as_array();
        if (!arr.empty() && arr.back().is_object() &&
            !params_hash_has_key(arr.back().as_object(), child_key)) {
            // Still filling in the current element
            auto wrapped = normalize(arr.back().as_object(), child_key, std::move(v), depth + 1);
            if (wrapped) {
                arr.push_back(std::move(*wrapped));
            }
            return;
        }

        Object element;
        auto wrapped = normalize(element, child_key, std::move(v), depth + 1);
        arr.push_back(wrapped ? std::move(*wrapped) : Value(std::move(element)));
        return;
    }

    // x[N]
    auto [head, rest] = split_key_head(tail, false);
    if (tail.front() == '[' && is_array_index(head)) {
        auto index = parse_array_index(head);
        if (!index || *index > array_index_limit_) {
            throw InvalidParameter(std::string(key),
                                   "array index " + std::string(head) +
                                       " exceeds limit " + std::to_string(array_index_limit_));
        }

        if (fresh) slot = Value::array();
        if (!slot.is_array()) {
            throw ParameterTypeError(std::string(key), "array", type_name(slot));
        }

        Array& arr = slot.as_array();
        const bool created = *index >= arr.size();
        if (created) {
            arr.resize(*index + 1, Value::object());
        }

        Value& element = arr[*index];
        if (rest.empty()) {
            element = std::move(v);
            return;
        }
        // Zero-extension placeholders take whatever shape the tail asks for
        const bool placeholder = element.is_object() && element.as_object().empty();
        check_depth(depth + 1);
        fold_tail(element, created || placeholder, key, rest, std::move(v), depth + 1);
        return;
    }

    // x[y]
    if (fresh) slot = Value::object();
    if (!slot.is_object()) {
        throw ParameterTypeError(std::string(key), "object", type_name(slot));
    }
    normalize(slot.as_object(), tail, std::move(v), depth + 1);
}

bool params_hash_has_key(const Object& hash, std::string_view key) {
    if (key.find("[]") != std::string_view::npos) {
        return false;
    }

    const Object* current = &hash;
    std::size_t pos = 0;
    while (pos < key.size()) {
        auto end = key.find_first_of("[]", pos);
        auto part = key.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                                  : end - pos);
        pos = (end == std::string_view::npos) ? key.size() : end + 1;
        if (part.empty()) {
            continue;
        }

        auto it = current->find(std::string(part));
        if (it == current->end()) {
            return false;
        }
        if (!it->second.is_object()) {
            return true;
        }
        current = &it->second.as_object();
    }
    return true;
}

} // namespace paramtree
