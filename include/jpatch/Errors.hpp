/**
 * @file Errors.hpp
 * @brief Exception types for jpatch pointer and patch errors
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - PointerError: Pointer evaluation failures (RootNotObject, InvalidPointer,
 *   UnresolvedPointer, KeyNotFound, ArrayIndexOutOfBounds, InvalidArrayIndex,
 *   InvalidArrayReference, UnresolvableToken)
 * - InvalidAddTarget, IndexTooLarge: add failures
 * - InvalidRemoveTarget: remove failures
 * - TestMismatch: test failures
 * - InvalidOperation: malformed patch operation JSON
 *
 * The what() strings are matched by callers and must not change.
 */

#ifndef JPATCH_ERRORS_HPP
#define JPATCH_ERRORS_HPP

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace jpatch {

/**
 * @brief Base class for all jpatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for failures while resolving a JSON Pointer
 */
class PointerError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Document root is not an object or an array
 */
class RootNotObject : public PointerError {
public:
    RootNotObject()
        : PointerError("The root object is not a valid JSON object.")
    {}
};

/**
 * @brief Non-empty pointer that does not start with '/'
 */
class InvalidPointer : public PointerError {
public:
    explicit InvalidPointer(std::string pointer)
        : PointerError("Invalid JSON Pointer: " + pointer)
        , pointer_(std::move(pointer))
    {}

    const std::string& pointer() const noexcept {
        return pointer_;
    }

private:
    std::string pointer_;
};

/**
 * @brief Evaluation reached null with tokens left to consume
 */
class UnresolvedPointer : public PointerError {
public:
    explicit UnresolvedPointer(std::string pointer)
        : PointerError("Unable to resolve pointer: " + pointer)
        , pointer_(std::move(pointer))
    {}

    const std::string& pointer() const noexcept {
        return pointer_;
    }

private:
    std::string pointer_;
};

/**
 * @brief Object has no member named by the reference token
 */
class KeyNotFound : public PointerError {
public:
    explicit KeyNotFound(std::string token)
        : PointerError("Key not found: " + token)
        , token_(std::move(token))
    {}

    /**
     * @brief Get the (unescaped) token that was not found
     */
    const std::string& token() const noexcept {
        return token_;
    }

private:
    std::string token_;
};

/**
 * @brief Array index is not smaller than the array length
 *
 * The message shows the parsed index, or the token text when the token
 * does not fit in std::size_t (index() is then saturated).
 */
class ArrayIndexOutOfBounds : public PointerError {
public:
    ArrayIndexOutOfBounds(const std::string& token, std::size_t index)
        : PointerError("Array index out of bounds: " + index_text(token, index))
        , token_(token)
        , index_(index)
    {}

    const std::string& token() const noexcept {
        return token_;
    }

    std::size_t index() const noexcept {
        return index_;
    }

private:
    static std::string index_text(const std::string& token, std::size_t index) {
        if (index == std::numeric_limits<std::size_t>::max()) {
            return token;
        }
        return std::to_string(index);
    }

    std::string token_;
    std::size_t index_;
};

/**
 * @brief Token applied to an array is not an unsigned integer
 */
class InvalidArrayIndex : public PointerError {
public:
    explicit InvalidArrayIndex(std::string token)
        : PointerError("Invalid array index: " + token)
        , token_(std::move(token))
    {}

    const std::string& token() const noexcept {
        return token_;
    }

private:
    std::string token_;
};

/**
 * @brief The '-' token was evaluated against an array
 *
 * '-' names the element after the last one, which never exists.
 */
class InvalidArrayReference : public PointerError {
public:
    InvalidArrayReference()
        : PointerError("Invalid reference: '-' points to a non-existent array element.")
    {}
};

/**
 * @brief Token applied to a value that is neither an object nor an array
 */
class UnresolvableToken : public PointerError {
public:
    UnresolvableToken(std::string token, std::string actual)
        : PointerError("Cannot resolve token '" + token + "' in non-object, non-array value.")
        , token_(std::move(token))
        , actual_(std::move(actual))
    {}

    const std::string& token() const noexcept {
        return token_;
    }

    /**
     * @brief Type name of the value the token was applied to
     */
    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string token_;
    std::string actual_;
};

/**
 * @brief add: the last token does not fit the shape of the target
 */
class InvalidAddTarget : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief add: insertion index is greater than the array length
 */
class IndexTooLarge : public PatchError {
public:
    IndexTooLarge(std::string token, std::size_t length)
        : PatchError("Pointer index: " + token +
                     " must not be greater than target array length: " +
                     std::to_string(length) + ".")
        , token_(std::move(token))
        , length_(length)
    {}

    const std::string& token() const noexcept {
        return token_;
    }

    std::size_t length() const noexcept {
        return length_;
    }

private:
    std::string token_;
    std::size_t length_;
};

/**
 * @brief remove: the target location cannot be removed
 */
class InvalidRemoveTarget : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief test: value at the path differs from the expected value
 */
class TestMismatch : public PatchError {
public:
    explicit TestMismatch(std::string path)
        : PatchError("Test operation failed due to value mismatch.")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Patch operation JSON is malformed or names an unknown op
 */
class InvalidOperation : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace jpatch

#endif // JPATCH_ERRORS_HPP
