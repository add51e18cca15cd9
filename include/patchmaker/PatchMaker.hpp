/**
 * @file PatchMaker.hpp
 * @brief Three-way merge patch calculation with self-verification
 *
 * PatchMaker turns (current, modified, original) domain objects into a
 * minimal merge patch plus the object that results from applying it:
 *
 * 1. Marshal current (keeping a pristine copy) and modified
 * 2. Run the calculate options over (current, modified)
 * 3. Marshal original, which never goes through the options
 * 4. Compute and verify the three-way patch (json_merge_patch)
 * 5. Unmarshal the patched bytes into a new T
 *
 * Example:
 * ```cpp
 * Value original = {{"a", 1}, {"b", 1}};
 * Value modified = {{"a", 2}, {"b", 1}};
 * Value current  = {{"a", 1}, {"b", 9}};
 * auto result = default_patch_maker().calculate(current, modified, original);
 * // result.patch == R"({"a":2})"
 * // result.patched == {"a": 2, "b": 9}
 * ```
 */

#ifndef PATCHMAKER_PATCH_MAKER_HPP
#define PATCHMAKER_PATCH_MAKER_HPP

#include "patchmaker/Codec.hpp"
#include "patchmaker/Errors.hpp"
#include "patchmaker/Logger.hpp"
#include "patchmaker/MergePatch.hpp"
#include "patchmaker/Options.hpp"
#include "patchmaker/PatchResult.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace patchmaker {

class PatchMaker {
public:
    /**
     * @brief Construct over a JSON merge patcher
     * @param json_merge_patcher Byte-level merge patch collaborator
     * @throws std::invalid_argument if json_merge_patcher is null
     */
    explicit PatchMaker(std::shared_ptr<const JsonMergePatcher> json_merge_patcher);

    /**
     * @brief Calculate the patch from current towards modified
     *
     * @param current Live object
     * @param modified Desired object
     * @param original Last applied object (a null Value means none)
     * @param options Transformations of (current, modified), in order
     * @return Patch, post-option documents and the patched object
     * @throws EncodingError if any object cannot be marshaled
     * @throws OptionError if an option fails
     * @throws PatchGenerationError if a diff cannot be computed
     * @throws PatchApplyError if a patch cannot be applied
     * @throws DecodingError if the patched bytes do not fit T
     */
    template <typename T>
    PatchResult<T> calculate(const T& current,
                             const T& modified,
                             const T& original,
                             const std::vector<CalculateOption>& options = {}) const;

    /**
     * @brief Compute and verify a three-way merge patch over bytes
     *
     * The raw three-way patch is applied to `current`, then re-diffed
     * against `current` so the reported patch is canonical ("{}" when
     * nothing effectively changes). That patch is applied to `pristine`
     * so fields masked by options survive in the patched document.
     *
     * @param original Last applied document
     * @param modified Desired document, after options
     * @param current Live document, after options
     * @param pristine Live document before options
     * @return (patch, patched current document)
     */
    std::pair<std::string, std::string> json_merge_patch(const std::string& original,
                                                         const std::string& modified,
                                                         const std::string& current,
                                                         const std::string& pristine) const;

private:
    template <typename T>
    static std::string encode(const T& object, const char* role);

    std::shared_ptr<const JsonMergePatcher> json_merge_patcher_;
};

/**
 * @brief Shared maker over BaseJsonMergePatcher
 */
const PatchMaker& default_patch_maker();

// ============================================================================
// Template implementation
// ============================================================================

template <typename T>
std::string PatchMaker::encode(const T& object, const char* role) {
    try {
        return marshal(object);
    } catch (const EncodingError& e) {
        Logger::Error("cannot marshal {} object: {}", role, e.details());
        throw EncodingError(std::string("convert ") + role + " object to byte sequence",
                            e.details());
    }
}

template <typename T>
PatchResult<T> PatchMaker::calculate(const T& current,
                                     const T& modified,
                                     const T& original,
                                     const std::vector<CalculateOption>& options) const {
    const std::string pristine = encode(current, "current");
    const std::string modified_bytes = encode(modified, "modified");

    BytePair pair;
    try {
        pair = apply_options(pristine, modified_bytes, options);
    } catch (const OptionError& e) {
        Logger::Error("{}", e.what());
        throw;
    }
    Logger::Debug("applied {} calculate option(s)", options.size());

    const std::string original_bytes = encode(original, "original");

    auto [patch, patched_current] = json_merge_patch(original_bytes, pair.modified,
                                                     pair.current, pristine);

    T patched;
    try {
        patched = unmarshal<T>(patched_current);
    } catch (const DecodingError& e) {
        Logger::Error("cannot unmarshal patched object: {}", e.details());
        throw DecodingError("create patched object", e.details());
    }

    return PatchResult<T>{std::move(patch),
                          std::move(pair.current),
                          std::move(pair.modified),
                          original_bytes,
                          std::move(patched)};
}

} // namespace patchmaker

#endif // PATCHMAKER_PATCH_MAKER_HPP
