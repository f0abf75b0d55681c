/**
 * @file QueryParser.hpp
 * @brief Nested bracket-key parser (Rack query parser semantics)
 *
 * Folds flat "key[sub][sub2]=value" pairs into an Object tree:
 * - "a=1&a=2"             → {"a": "2"}            (last plain key wins)
 * - "a[]=1&a[]=2"         → {"a": ["1", "2"]}
 * - "a[b][c]=1"           → {"a": {"b": {"c": "1"}}}
 * - "x[][y]=1&x[][y]=2"   → {"x": [{"y": "1"}, {"y": "2"}]}
 * - "x[][y]=1&x[][z]=2"   → {"x": [{"y": "1", "z": "2"}]}
 * - "a[1]=x"              → {"a": [{}, "x"]}
 *
 * Query values are LooseString; a pair without '=' yields Null.
 */

#ifndef PARAMTREE_QUERYPARSER_HPP
#define PARAMTREE_QUERYPARSER_HPP

#include "paramtree/Errors.hpp"
#include "paramtree/Value.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace paramtree {

constexpr std::size_t DEFAULT_DEPTH_LIMIT = 100;
constexpr std::size_t DEFAULT_ARRAY_INDEX_LIMIT = 10000;

class QueryParser {
public:
    explicit QueryParser(std::size_t depth_limit = DEFAULT_DEPTH_LIMIT,
                         std::size_t array_index_limit = DEFAULT_ARRAY_INDEX_LIMIT) noexcept
        : depth_limit_(depth_limit)
        , array_index_limit_(array_index_limit)
    {}

    std::size_t depth_limit() const noexcept { return depth_limit_; }
    std::size_t array_index_limit() const noexcept { return array_index_limit_; }

    /**
     * @brief Parse a raw query string into a fresh Object
     * @throws ParamsTooDeep, ParameterTypeError, InvalidParameter
     */
    Object parse_nested_query(std::string_view qs) const;

    /**
     * @brief Fold a raw query (or form body) string into an existing tree
     *
     * Pairs are '&'-separated and form-url-decoded. Processing stops at the
     * first failing pair; pairs before it stay folded.
     */
    void parse_nested_query_into(Object& params, std::string_view qs) const;

    /**
     * @brief Fold one already-decoded key/value pair into the tree
     *
     * An empty key is a no-op.
     */
    void parse_nested_value(Object& params, std::string_view key, Value value) const;

private:
    // Returns a value when the key does not address `params` itself: Null
    // for an empty head, or [v] for a trailing "[]" below the root. Any
    // other outcome is written into `params`.
    std::optional<Value> normalize(Object& params, std::string_view name,
                                   Value v, std::size_t depth) const;

    // Applies a non-empty tail to the slot stored under `key`. `fresh` is
    // true when the slot was just created and may take any container shape.
    void fold_tail(Value& slot, bool fresh, std::string_view key,
                   std::string_view tail, Value v, std::size_t depth) const;

    void check_depth(std::size_t depth) const;

    std::size_t depth_limit_;
    std::size_t array_index_limit_;
};

/**
 * @brief Whether `key` already resolves to a leaf inside the hash
 *
 * Walks the bracket segments of `key`; a path through "[]" never counts as
 * present. Used to decide when "x[][y]" starts a new array element.
 */
bool params_hash_has_key(const Object& hash, std::string_view key);

} // namespace paramtree

#endif // PARAMTREE_QUERYPARSER_HPP
