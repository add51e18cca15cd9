/**
 * @file PatchResult.hpp
 * @brief Result of a patch calculation
 */

#ifndef PATCHMAKER_PATCH_RESULT_HPP
#define PATCHMAKER_PATCH_RESULT_HPP

#include "patchmaker/Value.hpp"

#include <ostream>
#include <sstream>
#include <string>

namespace patchmaker {

/**
 * @brief Patch plus the documents it was computed from
 *
 * `current` and `modified` are the bytes after all calculate options
 * ran; `original` never goes through options. `patched` is a fresh T
 * built from the pristine current document with the patch applied.
 *
 * A result is a snapshot: its members cannot be reassigned.
 */
template <typename T>
struct PatchResult {
    const std::string patch;
    const std::string current;
    const std::string modified;
    const std::string original;
    const T patched;

    /**
     * @brief Check whether the patch changes nothing
     * @return true iff the patch is exactly "{}"
     */
    bool is_empty() const {
        return patch == kEmptyPatch;
    }

    /**
     * @brief Render all documents for diagnostics
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "\nPatch: " << patch
            << " \nCurrent: " << current
            << "\nModified: " << modified
            << "\nOriginal: " << original << "\n";
        return oss.str();
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const PatchResult<T>& result) {
    return os << result.to_string();
}

} // namespace patchmaker

#endif // PATCHMAKER_PATCH_RESULT_HPP
