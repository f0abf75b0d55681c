/**
 * @file KeyPath.cpp
 * @brief Implementation of bracket key utilities
 */

#include "paramtree/KeyPath.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace paramtree {

KeySplit split_key_head(std::string_view name, bool at_root) noexcept {
    if (name.empty()) {
        return {};
    }

    if (at_root) {
        auto start = name.find('[', 1);
        if (start == std::string_view::npos) {
            return {name, {}};
        }
        return {name.substr(0, start), name.substr(start)};
    }

    if (name.compare(0, 2, "[]") == 0) {
        return {name.substr(0, 2), name.substr(2)};
    }

    if (name.front() == '[') {
        auto close = name.find(']', 1);
        if (close != std::string_view::npos) {
            return {name.substr(1, close - 1), name.substr(close + 1)};
        }
    }

    return {name, {}};
}

std::vector<std::string> split_key_path(std::string_view key) {
    std::vector<std::string> segments;
    if (key.empty()) {
        return segments;
    }

    auto [root, tail] = split_key_head(key, true);
    if (tail == "[") {
        segments.emplace_back(key);
        return segments;
    }
    segments.emplace_back(root);

    while (!tail.empty()) {
        auto [head, rest] = split_key_head(tail, false);
        if (rest == "[") {
            // "[x][" is stored under its literal text
            segments.emplace_back(tail);
            break;
        }
        if (head == "[]") {
            segments.emplace_back();
        } else {
            segments.emplace_back(head);
        }
        tail = rest;
    }

    return segments;
}

std::string join_key_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << segments.front();
    for (std::size_t i = 1; i < segments.size(); ++i) {
        oss << '[' << segments[i] << ']';
    }
    return oss.str();
}

bool is_array_index(std::string_view segment) noexcept {
    if (segment.empty()) return false;
    // Must be all digits, no leading zeros except "0" itself
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

std::optional<std::size_t> parse_array_index(std::string_view segment) noexcept {
    if (!is_array_index(segment)) {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc() || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

bool has_nested_key(std::string_view key) noexcept {
    return !split_key_head(key, true).tail.empty();
}

} // namespace paramtree
