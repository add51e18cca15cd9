/**
 * @file Annotator.hpp
 * @brief Last-applied configuration stored on the object itself
 *
 * Reconciliation keeps the "original" document of the next three-way
 * patch in an annotation on the live object:
 *
 * ```cpp
 * Annotator annotator;
 * Value desired = {{"metadata", {{"name", "web"}}}, {"spec", {{"replicas", 3}}}};
 * annotator.set_last_applied(desired);
 * // desired.metadata.annotations["patchmaker/last-applied"] ==
 * //     R"({"metadata":{"name":"web"},"spec":{"replicas":3}})"
 *
 * Value original = annotator.get_original_configuration(live);
 * auto result = default_patch_maker().calculate(live, desired, original);
 * ```
 */

#ifndef PATCHMAKER_ANNOTATOR_HPP
#define PATCHMAKER_ANNOTATOR_HPP

#include "patchmaker/Value.hpp"
#include <string>

namespace patchmaker {

/// Default annotation key for the last applied configuration.
inline constexpr const char* kLastAppliedAnnotation = "patchmaker/last-applied";

class Annotator {
public:
    explicit Annotator(std::string key = kLastAppliedAnnotation);

    const std::string& key() const noexcept { return key_; }

    /**
     * @brief Record the object's own configuration in its annotations
     *
     * The stored text excludes the annotation itself, and
     * metadata.annotations is created when missing.
     *
     * @param object Object to annotate (modified in place)
     * @throws EncodingError if object or its metadata/annotations is not
     *         an object, or the object cannot be dumped
     */
    void set_last_applied(Value& object) const;

    /**
     * @brief Read the last applied configuration back
     *
     * @param object Annotated object
     * @return Parsed configuration, or null when there is none
     * @throws DecodingError if the annotation is not a string of valid JSON
     */
    Value get_original_configuration(const Value& object) const;

    /**
     * @brief Copy of object without the last-applied annotation
     *
     * Empty annotations and metadata objects left behind are removed too.
     */
    Value strip(const Value& object) const;

private:
    std::string key_;
};

} // namespace patchmaker

#endif // PATCHMAKER_ANNOTATOR_HPP
