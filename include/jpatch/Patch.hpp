/**
 * @file Patch.hpp
 * @brief JSON Patch (RFC6902) operations and patch application
 *
 * Every operation takes the document by const reference and returns a new
 * document. The input is never modified, so a caller always keeps a valid
 * copy of the document it passed in, even when an operation throws.
 *
 * Behaviors callers rely on:
 * - add at "" wraps the value: the result is {"value": <value>}
 * - remove at "" yields an empty object, whatever the root type was
 * - remove refuses array elements that are falsy (0, NaN, "", false, null)
 * - replace is remove followed by add, so the target must exist
 * - move evaluates "from" first, then removes it, then adds at "path";
 *   the index shift from the removal is visible to the add
 * - copy with from == path returns the document unchanged without
 *   evaluating either location; the result is still a value copy
 * - test returns the very document it was given
 */

#ifndef JPATCH_PATCH_HPP
#define JPATCH_PATCH_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Operation.hpp"
#include <functional>
#include <vector>

namespace jpatch {

/**
 * @brief Observer invoked after a successful apply_patch()
 *
 * Receives the final document and the operation list.
 */
using Hook = std::function<void(const Value&, const std::vector<Operation>&)>;

/**
 * @brief Add a value at a location
 *
 * The parent of the location must already exist. The last token selects:
 * - "-": append to the parent array
 * - digits: insert into the parent array, shifting later elements right;
 *   an index equal to the size appends
 * - anything else: set the member of the parent object
 *
 * @throws InvalidPointer if path lacks the leading '/'
 * @throws PointerError if the parent location does not resolve
 * @throws InvalidAddTarget if the parent's shape does not fit the last token
 * @throws IndexTooLarge if the index is greater than the array size
 *
 * Example:
 * ```cpp
 * Value doc = {{"e", {5, 6}}};
 * add(doc, AddOp{"/e/1", 99});   // {"e": [5, 99, 6]}
 * add(doc, AddOp{"/e/-", 99});   // {"e": [5, 6, 99]}
 * add(doc, AddOp{"/x/-", 99});   // throws KeyNotFound
 * ```
 */
Value add(const Value& document, const AddOp& op);

/**
 * @brief Remove the value at a location
 *
 * @throws InvalidPointer if path lacks the leading '/'
 * @throws PointerError if the parent location does not resolve
 * @throws InvalidRemoveTarget if the location cannot be removed
 */
Value remove(const Value& document, const RemoveOp& op);

/**
 * @brief Replace the value at an existing location
 *
 * Same as add(remove(document, path), path, value).
 */
Value replace(const Value& document, const ReplaceOp& op);

/**
 * @brief Move a value from one location to another
 */
Value move(const Value& document, const MoveOp& op);

/**
 * @brief Copy a value from one location to another
 *
 * When from == path nothing is evaluated, so a missing location does not
 * throw. The return is by value like the other mutating operations; only
 * test() hands back the caller's own object.
 */
Value copy(const Value& document, const CopyOp& op);

/**
 * @brief Check that the value at a location equals an expected value
 *
 * @return document itself (same object) when the values are equal
 * @throws TestMismatch if the values differ (see is_equal())
 * @throws PointerError if the path does not resolve
 */
const Value& test(const Value& document, const TestOp& op);

/**
 * @brief Apply a single operation of any kind
 */
Value apply_operation(const Value& document, const Operation& op);

/**
 * @brief Apply operations in order
 *
 * Stops at the first failing operation and rethrows its error; no
 * partially patched document is returned. On success each hook is called
 * in order with the result and ops. Exceptions from a hook propagate and
 * skip the remaining hooks.
 *
 * Example:
 * ```cpp
 * Value doc = {{"foo", "bar"}};
 * auto out = apply_patch(doc, {
 *     AddOp{"/baz", 0},
 *     RemoveOp{"/foo"},
 *     TestOp{"/baz", 0},
 * });
 * // out == {"baz": 0}, doc unchanged
 * ```
 */
Value apply_patch(const Value& document, const std::vector<Operation>& ops,
                  const std::vector<Hook>& hooks = {});

/**
 * @brief Decode an RFC6902 patch document and apply it
 *
 * @throws InvalidOperation if patch is malformed (nothing is applied)
 */
Value apply_patch(const Value& document, const Value& patch,
                  const std::vector<Hook>& hooks = {});

} // namespace jpatch

#endif // JPATCH_PATCH_HPP
