/**
 * @file Operation.cpp
 * @brief Implementation of the operation JSON codec
 */

#include "jpatch/Operation.hpp"
#include <type_traits>

namespace jpatch {

namespace {
    template <class T>
    struct always_false : std::false_type {};

    /**
     * @brief Fetch a required string member
     */
    std::string require_string(const Value& json, const std::string& op,
                               const char* member) {
        auto it = json.find(member);
        if (it == json.end()) {
            throw InvalidOperation("Missing '" + std::string(member) +
                                   "' in " + op + " operation");
        }
        if (!it->is_string()) {
            throw InvalidOperation("'" + std::string(member) + "' must be a string in " +
                                   op + " operation, got " + type_name(*it));
        }
        return it->get<std::string>();
    }

    /**
     * @brief Fetch a required value member (null is allowed)
     */
    Value require_value(const Value& json, const std::string& op) {
        auto it = json.find("value");
        if (it == json.end()) {
            throw InvalidOperation("Missing 'value' in " + op + " operation");
        }
        return *it;
    }
}

std::string op_name(const Operation& op) {
    return std::visit([](const auto& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, AddOp>) return "add";
        else if constexpr (std::is_same_v<T, RemoveOp>) return "remove";
        else if constexpr (std::is_same_v<T, ReplaceOp>) return "replace";
        else if constexpr (std::is_same_v<T, MoveOp>) return "move";
        else if constexpr (std::is_same_v<T, CopyOp>) return "copy";
        else if constexpr (std::is_same_v<T, TestOp>) return "test";
        else static_assert(always_false<T>::value, "unhandled operation kind");
    }, op);
}

Operation parse_operation(const Value& json) {
    if (!json.is_object()) {
        throw InvalidOperation("Operation must be an object, got " + type_name(json));
    }

    auto op_it = json.find("op");
    if (op_it == json.end() || !op_it->is_string()) {
        throw InvalidOperation("Operation is missing a string 'op' member");
    }
    const auto op = op_it->get<std::string>();

    if (op == "add") {
        return AddOp{require_string(json, op, "path"), require_value(json, op)};
    }
    if (op == "remove") {
        return RemoveOp{require_string(json, op, "path")};
    }
    if (op == "replace") {
        return ReplaceOp{require_string(json, op, "path"), require_value(json, op)};
    }
    if (op == "move") {
        return MoveOp{require_string(json, op, "from"), require_string(json, op, "path")};
    }
    if (op == "copy") {
        return CopyOp{require_string(json, op, "from"), require_string(json, op, "path")};
    }
    if (op == "test") {
        return TestOp{require_string(json, op, "path"), require_value(json, op)};
    }

    throw InvalidOperation("Unknown operation: " + op);
}

std::vector<Operation> parse_patch(const Value& json) {
    if (!json.is_array()) {
        throw InvalidOperation("Patch must be an array, got " + type_name(json));
    }

    std::vector<Operation> ops;
    ops.reserve(json.size());

    for (std::size_t i = 0; i < json.size(); ++i) {
        try {
            ops.push_back(parse_operation(json[i]));
        } catch (const InvalidOperation& e) {
            throw InvalidOperation("Operation " + std::to_string(i) + ": " + e.what());
        }
    }

    return ops;
}

Value to_json(const Operation& op) {
    Value out = {{"op", op_name(op)}};

    std::visit([&out](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOp> || std::is_same_v<T, CopyOp>) {
            out["from"] = o.from;
        }
        out["path"] = o.path;
        if constexpr (std::is_same_v<T, AddOp> || std::is_same_v<T, ReplaceOp> ||
                      std::is_same_v<T, TestOp>) {
            out["value"] = o.value;
        }
    }, op);

    return out;
}

Value to_json(const std::vector<Operation>& ops) {
    Value out = Value::array();
    for (const auto& op : ops) {
        out.push_back(to_json(op));
    }
    return out;
}

} // namespace jpatch
