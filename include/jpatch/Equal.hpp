/**
 * @file Equal.hpp
 * @brief Deep structural equality used by the test operation
 */

#ifndef JPATCH_EQUAL_HPP
#define JPATCH_EQUAL_HPP

#include "jpatch/Value.hpp"

namespace jpatch {

/**
 * @brief Compare two values structurally
 *
 * Rules, in order:
 * - Equal primitives are equal. All numeric representations form a
 *   single type, so 1 equals 1.0.
 * - NaN equals NaN.
 * - Values of different JSON types are unequal.
 * - Arrays are equal if they have the same length and equal elements
 *   at every position.
 * - Objects are equal if they have the same number of members and every
 *   member of one exists in the other with an equal value. Member order
 *   is ignored.
 *
 * No numeric coercion of strings and no partial matching.
 *
 * Examples:
 * ```cpp
 * is_equal(Value{{"a", 1}, {"b", 2}}, Value{{"b", 2}, {"a", 1}});  // true
 * is_equal(Value(42), Value("42"));                                // false
 * is_equal(Value::array({1, 2}), Value::array({1, 2, 3}));         // false
 * ```
 */
bool is_equal(const Value& a, const Value& b);

} // namespace jpatch

#endif // JPATCH_EQUAL_HPP
