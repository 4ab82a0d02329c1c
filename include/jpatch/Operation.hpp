/**
 * @file Operation.hpp
 * @brief JSON Patch (RFC6902) operation types and their JSON form
 *
 * Operation is a closed variant with one alternative per op kind. Unknown
 * kinds cannot be represented, so the JSON decoder rejects them.
 *
 * JSON shape of one operation:
 * ```json
 * {"op": "add",     "path": "/a", "value": 1}
 * {"op": "remove",  "path": "/a"}
 * {"op": "replace", "path": "/a", "value": 1}
 * {"op": "move",    "from": "/a", "path": "/b"}
 * {"op": "copy",    "from": "/a", "path": "/b"}
 * {"op": "test",    "path": "/a", "value": 1}
 * ```
 */

#ifndef JPATCH_OPERATION_HPP
#define JPATCH_OPERATION_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Errors.hpp"
#include <string>
#include <variant>
#include <vector>

namespace jpatch {

struct AddOp {
    std::string path;
    Value value;
};

struct RemoveOp {
    std::string path;
};

struct ReplaceOp {
    std::string path;
    Value value;
};

struct MoveOp {
    std::string from;
    std::string path;
};

struct CopyOp {
    std::string from;
    std::string path;
};

struct TestOp {
    std::string path;
    Value value;
};

using Operation = std::variant<AddOp, RemoveOp, ReplaceOp, MoveOp, CopyOp, TestOp>;

/**
 * @brief Name of the op kind ("add", "remove", ...)
 */
std::string op_name(const Operation& op);

/**
 * @brief Decode a single operation object
 *
 * @param json Operation object as shown in the file header
 * @return Decoded operation
 * @throws InvalidOperation if json is not an object, "op" is missing or
 *         unknown, or a required member is missing or has the wrong type
 *
 * "value" may be null but must be present for add, replace and test.
 */
Operation parse_operation(const Value& json);

/**
 * @brief Decode a patch document (array of operation objects)
 *
 * @throws InvalidOperation if json is not an array or any element is
 *         malformed. The message names the index of the bad element.
 */
std::vector<Operation> parse_patch(const Value& json);

/**
 * @brief Encode an operation as its RFC6902 JSON object
 */
Value to_json(const Operation& op);

/**
 * @brief Encode a list of operations as a patch document
 */
Value to_json(const std::vector<Operation>& ops);

} // namespace jpatch

#endif // JPATCH_OPERATION_HPP
