/**
 * @file KeyPath.hpp
 * @brief Bracket-notation key utilities
 *
 * A flat parameter key such as "users[0][name]" or "tags[]" encodes a
 * nested path. These helpers split such keys the same way the nested
 * normalizer walks them:
 * - The root is everything before the first '[' found at index >= 1
 * - "[]" is an explicit empty segment (append to array)
 * - "[x]" is the segment "x"
 * - Stray or unbalanced brackets are literal characters, never errors
 */

#ifndef PARAMTREE_KEYPATH_HPP
#define PARAMTREE_KEYPATH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paramtree {

/**
 * @brief One step of key tokenisation: the leading segment and the rest
 *
 * Both views point into the key that was split.
 */
struct KeySplit {
    std::string_view head;
    std::string_view tail;
};

/**
 * @brief Split off the leading segment of a (partial) bracket key
 *
 * @param name Key, or the unconsumed tail of a key
 * @param at_root true for the first step of a key, false for tails
 *
 * At the root the head is the text before the first '[' at index >= 1.
 * For tails:
 * - "[]rest"  → head "[]", tail "rest"
 * - "[x]rest" → head "x",  tail "rest"
 * - anything else (no leading '[' or no closing ']') → the whole name
 *
 * Examples:
 * - ("a[b][c]", true)  → {"a", "[b][c]"}
 * - ("[b][c]", false)  → {"b", "[c]"}
 * - ("[][c]", false)   → {"[]", "[c]"}
 * - ("l[m]", false)    → {"l[m]", ""}
 */
KeySplit split_key_head(std::string_view name, bool at_root) noexcept;

/**
 * @brief Split a bracket key into its path segments
 *
 * Examples:
 * - "users[0][name]" → ["users", "0", "name"]
 * - "tags[]"         → ["tags", ""]
 * - "foo["           → ["foo["]
 * - "j[k]l[m]"       → ["j", "k", "l[m]"]
 * - "f[[]]"          → ["f", "[", "]"]
 * - ""               → []
 */
std::vector<std::string> split_key_path(std::string_view key);

/**
 * @brief Inverse of split_key_path() for well-formed segment lists
 *
 * Examples:
 * - ["users", "0", "name"] → "users[0][name]"
 * - ["tags", ""]           → "tags[]"
 * - ["single"]             → "single"
 */
std::string join_key_path(const std::vector<std::string>& segments);

/**
 * @brief Check if segment is an array index (digits, no leading zeros)
 */
bool is_array_index(std::string_view segment) noexcept;

/**
 * @brief Parse an array index segment
 * @return The index, or nullopt if not an index or it overflows size_t
 */
std::optional<std::size_t> parse_array_index(std::string_view segment) noexcept;

/**
 * @brief true if the key has a bracketed part after its root
 */
bool has_nested_key(std::string_view key) noexcept;

} // namespace paramtree

#endif // PARAMTREE_KEYPATH_HPP
