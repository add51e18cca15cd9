/**
 * @file Options.hpp
 * @brief Calculate options: (current, modified) byte transformations
 *
 * Options run before the three-way diff, strictly in the order given,
 * each receiving the previous option's output. They are typically used
 * to mask fields that should not take part in patch calculation, such
 * as status blocks or generation counters.
 *
 * An option reports failure by throwing; PatchMaker wraps the failure
 * in OptionError.
 */

#ifndef PATCHMAKER_OPTIONS_HPP
#define PATCHMAKER_OPTIONS_HPP

#include <functional>
#include <string>
#include <vector>

namespace patchmaker {

/**
 * @brief The (current, modified) document pair passed through options
 */
struct BytePair {
    std::string current;
    std::string modified;
};

/**
 * @brief Transformation of the (current, modified) byte pair
 *
 * Receives both documents in full and must return both, even when it
 * only rewrites one side.
 */
using CalculateOption = std::function<BytePair(const std::string& current,
                                               const std::string& modified)>;

/**
 * @brief Apply options in order
 *
 * @param current Current document bytes
 * @param modified Modified document bytes
 * @param options Options, applied left to right
 * @return Pair produced by the last option (inputs when options is empty)
 * @throws OptionError naming the index of the first failing option
 */
BytePair apply_options(const std::string& current,
                       const std::string& modified,
                       const std::vector<CalculateOption>& options);

/**
 * @brief Remove the top-level "status" field from both sides
 */
CalculateOption ignore_status_fields();

/**
 * @brief Remove the field at a dot-path from both sides, when present
 *
 * Example:
 * ```cpp
 * auto opt = ignore_field("metadata.generation");
 * auto out = opt(R"({"metadata":{"generation":4,"name":"a"}})",
 *                R"({"metadata":{"name":"a"}})");
 * // out.current == R"({"metadata":{"name":"a"}})"
 * ```
 */
CalculateOption ignore_field(const std::string& path);

/**
 * @brief Remove each of the given dot-paths from both sides, in order
 */
CalculateOption ignore_fields(const std::vector<std::string>& paths);

/**
 * @brief Recursively remove null object members from both sides
 *
 * Unset optional fields usually marshal as null; without this option
 * they show up as deletions in the patch.
 */
CalculateOption delete_null_in_json();

} // namespace patchmaker

#endif // PATCHMAKER_OPTIONS_HPP
