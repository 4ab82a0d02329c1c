/**
 * @file Pointer.hpp
 * @brief JSON Pointer (RFC6901) interpretation and evaluation
 *
 * A pointer is a string of '/'-prefixed reference tokens:
 * - "" refers to the whole document
 * - "/foo/0" refers to the first element of the array member "foo"
 * - "/a~1b" refers to member "a/b" and "/m~0n" to member "m~n"
 *
 * Splitting a pointer on '/' always yields a leading empty token for a
 * well-formed pointer. That token is kept in PointerParts::tokens and is
 * what evaluation checks to reject pointers without a leading '/'.
 */

#ifndef JPATCH_POINTER_HPP
#define JPATCH_POINTER_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Result of splitting and unescaping a pointer
 */
struct PointerParts {
    std::string pointer;
    /// All unescaped tokens, including the leading "" of a valid pointer
    std::vector<std::string> tokens;
    /// Second-to-last token, "" when there are fewer than two tokens
    std::string parent;
    /// Last token, "" when there are fewer than two tokens
    std::string key;
};

/**
 * @brief Unescape a single reference token
 *
 * "~1" is replaced before "~0", so "~01" decodes to "~1" and not "/".
 */
std::string unescape_token(const std::string& token);

/**
 * @brief Escape a single reference token ("~" -> "~0", then "/" -> "~1")
 */
std::string escape_token(const std::string& token);

/**
 * @brief Split a pointer on '/' and unescape every piece
 *
 * Performs no validation.
 *
 * Examples:
 * - "" → tokens [""], parent "", key ""
 * - "/a/b" → tokens ["", "a", "b"], parent "a", key "b"
 * - "/slash~1key" → tokens ["", "slash/key"]
 */
PointerParts interpret_pointer(const std::string& pointer);

/**
 * @brief Build a pointer from unescaped reference tokens
 *
 * @param tokens Reference tokens, without the leading empty token
 * @return Pointer string, "" for an empty vector
 *
 * Example: ["a/b", "0"] → "/a~1b/0"
 */
std::string join_pointer(const std::vector<std::string>& tokens);

/**
 * @brief Check whether a token matches the array index pattern [0-9]+
 *
 * Leading zeros are accepted ("01" is index 1).
 */
bool is_array_index(const std::string& token);

/**
 * @brief Parse a token accepted by is_array_index()
 *
 * Values too large for size_t saturate to the maximum size_t, which is
 * out of range for every array.
 */
std::size_t parse_array_index(const std::string& token);

/**
 * @brief Resolve a pointer against a document
 *
 * @param document Root value, must be an object or an array
 * @param pointer RFC6901 pointer string
 * @return Reference to the value inside document (not a copy)
 * @throws RootNotObject if document is not an object or array
 * @throws InvalidPointer if pointer is non-empty and lacks the leading '/'
 * @throws UnresolvedPointer if a null value is reached with tokens left
 * @throws KeyNotFound if an object lacks the named member
 * @throws InvalidArrayReference if "-" is applied to an array
 * @throws InvalidArrayIndex if a non-numeric token is applied to an array
 * @throws ArrayIndexOutOfBounds if an index is not below the array size
 * @throws UnresolvableToken if a token is applied to a primitive
 *
 * Example:
 * ```cpp
 * Value doc = {{"a", 1}, {"b", {{"c", 2}, {"d", {3, 4}}}}};
 * evaluate(doc, "/b/d/1");  // 4
 * evaluate(doc, "");        // doc itself
 * evaluate(doc, "/x");      // throws KeyNotFound
 * ```
 */
const Value& evaluate(const Value& document, const std::string& pointer);

/**
 * @brief Mutable overload of evaluate()
 */
Value& evaluate(Value& document, const std::string& pointer);

/**
 * @brief Resolve already-interpreted tokens against a document
 *
 * Same rules as evaluate(). tokens must include the leading empty token;
 * error messages name the pointer rebuilt from the tokens.
 */
const Value& evaluate_tokens(const Value& document, const std::vector<std::string>& tokens);

/**
 * @brief Mutable overload of evaluate_tokens()
 */
Value& evaluate_tokens(Value& document, const std::vector<std::string>& tokens);

/**
 * @brief Check whether a pointer resolves within a document
 *
 * @return true if evaluate() would succeed, false if the location is absent
 * @throws RootNotObject if document is not an object or array
 * @throws InvalidPointer if pointer lacks the leading '/'
 */
bool contains_pointer(const Value& document, const std::string& pointer);

} // namespace jpatch

#endif // JPATCH_POINTER_HPP
