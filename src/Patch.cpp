/**
 * @file Patch.cpp
 * @brief Implementation of JSON Patch operations
 */

#include "jpatch/Patch.hpp"
#include "jpatch/Pointer.hpp"
#include "jpatch/Equal.hpp"
#include <cstddef>
#include <string>
#include <type_traits>

namespace jpatch {

namespace {
    template <class T>
    struct always_false : std::false_type {};

    /**
     * @brief Tokens of the parent location (last token dropped)
     * @pre tokens.size() >= 2
     */
    std::vector<std::string> parent_tokens(const std::vector<std::string>& tokens) {
        return std::vector<std::string>(tokens.begin(), tokens.end() - 1);
    }
}

Value add(const Value& document, const AddOp& op) {
    const auto parts = interpret_pointer(op.path);
    const auto& tokens = parts.tokens;

    if (!tokens[0].empty()) {
        throw InvalidPointer(op.path);
    }

    // The whole document is addressed: wrap the value instead of replacing
    if (tokens.size() == 1) {
        Value wrapped = Value::object();
        wrapped["value"] = op.value;
        return wrapped;
    }

    Value result = document;
    Value& target = evaluate_tokens(result, parent_tokens(tokens));
    const auto& key = parts.key;

    if (key == "-") {
        if (!target.is_array()) {
            throw InvalidAddTarget("Invalid pointer operation on target.");
        }
        target.push_back(op.value);
        return result;
    }

    if (is_array_index(key)) {
        if (!target.is_array()) {
            throw InvalidAddTarget("Invalid pointer operation on target.");
        }
        const std::size_t idx = parse_array_index(key);
        if (idx > target.size()) {
            throw IndexTooLarge(key, target.size());
        }
        target.insert(target.begin() + static_cast<std::ptrdiff_t>(idx), op.value);
        return result;
    }

    if (target.is_object()) {
        target[key] = op.value;
        return result;
    }

    throw InvalidAddTarget("Invalid add operation for pointer: " + op.path);
}

Value remove(const Value& document, const RemoveOp& op) {
    const auto parts = interpret_pointer(op.path);
    const auto& tokens = parts.tokens;

    if (!tokens[0].empty()) {
        throw InvalidPointer(op.path);
    }

    // Removing the whole document leaves an empty object, even for an array root
    if (tokens.size() == 1) {
        return Value::object();
    }

    const auto& key = parts.key;
    if (key == "-") {
        throw InvalidRemoveTarget("Invalid pointer for remove operation: " + op.path);
    }

    Value result = document;
    Value& target = evaluate_tokens(result, parent_tokens(tokens));

    if (is_array_index(key)) {
        if (!target.is_array()) {
            throw InvalidRemoveTarget("Cannot remove array elements at non-Array target.");
        }
        const std::size_t idx = parse_array_index(key);
        // Falsy elements count as non-existent
        if (idx >= target.size() || !is_truthy(target[idx])) {
            throw InvalidRemoveTarget("Attempting to index non-existent element at target array.");
        }
        target.erase(idx);
        return result;
    }

    if (target.is_object()) {
        if (!target.contains(key)) {
            throw InvalidRemoveTarget("Attempting to access undefined value at target object.");
        }
        target.erase(key);
        return result;
    }

    throw InvalidRemoveTarget("Invalid remove operation for pointer: " + op.path);
}

Value replace(const Value& document, const ReplaceOp& op) {
    return add(remove(document, RemoveOp{op.path}), AddOp{op.path, op.value});
}

Value move(const Value& document, const MoveOp& op) {
    const Value& value = evaluate(document, op.from);
    return add(remove(document, RemoveOp{op.from}), AddOp{op.path, value});
}

Value copy(const Value& document, const CopyOp& op) {
    if (op.from == op.path) {
        return document;
    }

    const Value& value = evaluate(document, op.from);
    return add(document, AddOp{op.path, value});
}

const Value& test(const Value& document, const TestOp& op) {
    if (!is_equal(evaluate(document, op.path), op.value)) {
        throw TestMismatch(op.path);
    }
    return document;
}

Value apply_operation(const Value& document, const Operation& op) {
    return std::visit([&document](const auto& o) -> Value {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, AddOp>) return add(document, o);
        else if constexpr (std::is_same_v<T, RemoveOp>) return remove(document, o);
        else if constexpr (std::is_same_v<T, ReplaceOp>) return replace(document, o);
        else if constexpr (std::is_same_v<T, MoveOp>) return move(document, o);
        else if constexpr (std::is_same_v<T, CopyOp>) return copy(document, o);
        else if constexpr (std::is_same_v<T, TestOp>) return test(document, o);
        else static_assert(always_false<T>::value, "unhandled operation kind");
    }, op);
}

Value apply_patch(const Value& document, const std::vector<Operation>& ops,
                  const std::vector<Hook>& hooks) {
    Value result = document;
    for (const auto& op : ops) {
        result = apply_operation(result, op);
    }

    for (const auto& hook : hooks) {
        if (hook) {
            hook(result, ops);
        }
    }

    return result;
}

Value apply_patch(const Value& document, const Value& patch,
                  const std::vector<Hook>& hooks) {
    return apply_patch(document, parse_patch(patch), hooks);
}

} // namespace jpatch
