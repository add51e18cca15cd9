/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for nested document access
 *
 * Paths look like "metadata.annotations" or "spec.ports.0.name". Numeric
 * segments index into arrays.
 *
 * Lookups and erasures are lenient: a path that does not resolve is
 * simply "not there". Documents from the live system routinely lack
 * optional fields, so a missing field is never an error.
 */

#ifndef PATCHMAKER_DOTPATH_HPP
#define PATCHMAKER_DOTPATH_HPP

#include "patchmaker/Value.hpp"
#include <string>
#include <vector>

namespace patchmaker {

/**
 * @brief Break a path into its segments, skipping empty ones
 *
 * - "metadata.generation" → ["metadata", "generation"]
 * - "spec.ports.0.name" → ["spec", "ports", "0", "name"]
 * - "" → []
 * - "a..b" → ["a", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Look up the value a path points at
 *
 * An empty path yields `&data`. Returns nullptr as soon as a segment is
 * missing, indexes past an array, or walks through a scalar.
 */
const Value* find_by_dot(const Value& data, const std::string& path);

/**
 * @brief Store a value at a path, building objects along the way
 *
 * Anything on the way that is not an object (arrays included) is
 * replaced by one. An empty path replaces `data` itself.
 *
 * Example:
 * ```cpp
 * Value obj = Value::object();
 * set_by_dot(obj, "metadata.annotations.owner", "ops");
 * // Result: {"metadata": {"annotations": {"owner": "ops"}}}
 * ```
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Delete the member or array element a path points at
 *
 * @return false when nothing was there (an empty path never matches)
 *
 * Example:
 * ```cpp
 * Value obj = {{"metadata", {{"name", "web"}, {"generation", 3}}}};
 * erase_by_dot(obj, "metadata.generation");  // true
 * // Result: {"metadata": {"name": "web"}}
 * erase_by_dot(obj, "status.phase");         // false, nothing to remove
 * ```
 */
bool erase_by_dot(Value& data, const std::string& path);

} // namespace patchmaker

#endif // PATCHMAKER_DOTPATH_HPP
