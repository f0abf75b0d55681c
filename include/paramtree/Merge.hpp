/**
 * @file Merge.hpp
 * @brief Combining parsed subtrees with the running parameter tree
 *
 * Merges are shallow and right-biased: on a key collision the incoming
 * value replaces the existing one wholesale.
 */

#ifndef PARAMTREE_MERGE_HPP
#define PARAMTREE_MERGE_HPP

#include "paramtree/Errors.hpp"
#include "paramtree/Value.hpp"

namespace paramtree {

/**
 * @brief Merge an object-shaped value into the running tree
 *
 * @param value Incoming value; must be an Object
 * @param existing Running tree (lower precedence)
 * @return Union of both, incoming keys winning
 * @throws MergeError if value is not an Object
 *
 * Examples:
 * ```cpp
 * merge_into({"a": 1}, {"b": 2})   // {"a": 1, "b": 2}
 * merge_into({"b": 3}, {"b": 2})   // {"b": 3}
 * merge_into([1, 2], {"b": 2})     // throws MergeError("object", "array")
 * ```
 */
Object merge_into(Value value, Object existing);

/**
 * @brief Merge two values of any shape
 *
 * - Null on either side   → the other side
 * - Object + Object       → union, b winning
 * - Array + Array         → concatenation
 * - Array + x             → x appended
 * - x + Array             → x prepended
 * - anything else         → MergeError naming both shapes
 *
 * @param a Existing value (lower precedence)
 * @param b Incoming value
 * @throws MergeError
 */
Value merge(Value a, Value b);

} // namespace paramtree

#endif // PARAMTREE_MERGE_HPP
