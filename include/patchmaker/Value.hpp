/**
 * @file Value.hpp
 * @brief Value type for documents and patches
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * Objects are backed by an ordered map, so dumping a Value always
 * produces the same bytes for the same logical content.
 */

#ifndef PATCHMAKER_VALUE_HPP
#define PATCHMAKER_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace patchmaker {

/**
 * @brief JSON value type used for every document in the pipeline
 *
 * This is an alias for nlohmann::json. Domain types become documents
 * through nlohmann's to_json/from_json hooks.
 */
using Value = nlohmann::json;

/// The canonical empty merge patch.
inline constexpr const char* kEmptyPatch = "{}";

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

} // namespace patchmaker

#endif // PATCHMAKER_VALUE_HPP
