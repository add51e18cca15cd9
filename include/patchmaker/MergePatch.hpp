/**
 * @file MergePatch.hpp
 * @brief JSON merge patch primitives (RFC 7386)
 *
 * A merge patch mirrors the structure of the target document: present
 * keys set values, nested objects recurse, and null removes a key.
 * Arrays are always replaced as a whole.
 *
 * Two layers are provided:
 * - Value functions (create_merge_patch, create_three_way_merge_patch,
 *   apply_merge_patch)
 * - JsonMergePatcher, the byte-level collaborator used by PatchMaker
 */

#ifndef PATCHMAKER_MERGE_PATCH_HPP
#define PATCHMAKER_MERGE_PATCH_HPP

#include "patchmaker/Value.hpp"

#include <string>

namespace patchmaker {

/**
 * @brief Create a two-way merge patch from one document to another
 *
 * Rules:
 * - Key only in `to`: added
 * - Type changed: replaced
 * - Both objects: recursive diff, omitted when empty
 * - Arrays and scalars: replaced when unequal
 * - Key only in `from`: set to null
 *
 * A null document is treated as an empty object.
 *
 * @param from Source document
 * @param to Target document
 * @return Patch that turns `from` into `to` ({} when equal)
 * @throws PatchGenerationError if either document is not an object
 *
 * Example:
 * ```cpp
 * Value from = {{"a", 1}, {"b", {{"x", 1}, {"y", 2}}}};
 * Value to = {{"a", 1}, {"b", {{"x", 2}}}, {"c", 3}};
 * auto patch = create_merge_patch(from, to);
 * // Result: {"b": {"x": 2, "y": null}, "c": 3}
 * ```
 */
Value create_merge_patch(const Value& from, const Value& to);

/**
 * @brief Create a three-way merge patch
 *
 * Takes the change from `original` to `modified` and drops the parts
 * that `current` already reflects: values it already holds and
 * deletions of keys it no longer has. Fields that differ only in
 * `current` (drift from other writers) are left alone.
 *
 * A null `original` means there is no previous configuration, so the
 * whole of `modified` is intended and nothing is deleted.
 *
 * @param original Last applied document
 * @param modified Desired document
 * @param current Live document
 * @return Merged patch ({} when there is nothing to do)
 * @throws PatchGenerationError if any document is not an object
 *
 * Example:
 * ```cpp
 * Value original = {{"a", 1}, {"b", 1}};
 * Value modified = {{"a", 2}, {"b", 1}};
 * Value current  = {{"a", 1}, {"b", 9}};
 * auto patch = create_three_way_merge_patch(original, modified, current);
 * // Result: {"a": 2}
 * ```
 */
Value create_three_way_merge_patch(const Value& original,
                                   const Value& modified,
                                   const Value& current);

/**
 * @brief Apply a merge patch to a document
 *
 * @param document Document to patch
 * @param patch Merge patch
 * @return Patched copy of `document`
 */
Value apply_merge_patch(const Value& document, const Value& patch);

/**
 * @brief Byte-level merge patch collaborator
 *
 * Documents and patches are JSON text. Implementations must be
 * stateless so a single instance can serve concurrent calculations.
 */
class JsonMergePatcher {
public:
    virtual ~JsonMergePatcher() = default;

    /**
     * @brief Two-way diff between byte documents
     * @throws PatchGenerationError on malformed or non-object documents
     */
    virtual std::string create_merge_patch(const std::string& from,
                                           const std::string& to) const = 0;

    /**
     * @brief Three-way diff between byte documents
     * @throws PatchGenerationError on malformed or non-object documents
     */
    virtual std::string create_three_way_json_merge_patch(const std::string& original,
                                                          const std::string& modified,
                                                          const std::string& current) const = 0;

    /**
     * @brief Apply a patch to a byte document
     * @throws PatchApplyError on malformed document or patch
     */
    virtual std::string merge_patch(const std::string& document,
                                    const std::string& patch) const = 0;
};

/**
 * @brief JsonMergePatcher backed by the Value functions above
 *
 * Output is compact JSON with sorted keys, so an empty patch is always
 * exactly "{}".
 */
class BaseJsonMergePatcher : public JsonMergePatcher {
public:
    std::string create_merge_patch(const std::string& from,
                                   const std::string& to) const override;

    std::string create_three_way_json_merge_patch(const std::string& original,
                                                  const std::string& modified,
                                                  const std::string& current) const override;

    std::string merge_patch(const std::string& document,
                            const std::string& patch) const override;
};

} // namespace patchmaker

#endif // PATCHMAKER_MERGE_PATCH_HPP
