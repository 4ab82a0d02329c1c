/**
 * @file Value.hpp
 * @brief Value type for JSON documents
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef JPATCH_VALUE_HPP
#define JPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <string>

namespace jpatch {

/**
 * @brief JSON value type for documents and patch operations
 *
 * This is an alias for nlohmann::json. Copying a Value is a deep copy.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Truthiness of a value
 *
 * null, false, 0, NaN and "" are falsy. Every container is truthy,
 * including empty ones.
 */
inline bool is_truthy(const Value& val) {
    if (val.is_null()) return false;
    if (val.is_boolean()) return val.get<bool>();
    if (val.is_number_float()) {
        const double d = val.get<double>();
        return d != 0.0 && !std::isnan(d);
    }
    if (val.is_number_unsigned()) return val.get<std::uint64_t>() != 0;
    if (val.is_number_integer()) return val.get<std::int64_t>() != 0;
    if (val.is_string()) return !val.get_ref<const std::string&>().empty();
    return true;
}

} // namespace jpatch

#endif // JPATCH_VALUE_HPP
