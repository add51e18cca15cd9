/**
 * @file MergePatch.cpp
 * @brief Implementation of JSON merge patch primitives
 */

#include "patchmaker/MergePatch.hpp"
#include "patchmaker/Errors.hpp"

namespace patchmaker {

namespace {

    /**
     * @brief Reject documents a merge patch cannot be computed from
     *
     * Null stands for "no document" and becomes an empty object.
     */
    Value require_object(const Value& doc, const char* role) {
        if (doc.is_null()) {
            return Value::object();
        }
        if (!doc.is_object()) {
            throw PatchGenerationError("create merge patch",
                std::string(role) + " document must be an object, got " + type_name(doc));
        }
        return doc;
    }

    Value diff_objects(const Value& from, const Value& to) {
        Value patch = Value::object();

        for (auto it = to.begin(); it != to.end(); ++it) {
            const auto& key = it.key();
            const auto& to_value = it.value();

            auto found = from.find(key);
            if (found == from.end()) {
                // Added
                patch[key] = to_value;
                continue;
            }

            if (found->is_object() && to_value.is_object()) {
                Value sub = diff_objects(*found, to_value);
                if (!sub.empty()) {
                    patch[key] = std::move(sub);
                }
                continue;
            }

            // Scalars, arrays and type changes are replaced whole
            if (*found != to_value) {
                patch[key] = to_value;
            }
        }

        for (auto it = from.begin(); it != from.end(); ++it) {
            if (!to.contains(it.key())) {
                patch[it.key()] = nullptr;
            }
        }

        return patch;
    }

    /**
     * @brief Drop deletions from a patch, keeping additions and changes
     *
     * Sub-objects that end up empty are dropped. An explicitly set empty
     * object is a value, not an empty sub-patch, and is kept.
     */
    Value strip_nulls(const Value& patch) {
        Value stripped = Value::object();

        for (auto it = patch.begin(); it != patch.end(); ++it) {
            const auto& val = it.value();

            if (val.is_null()) {
                continue;
            }
            if (val.is_object() && !val.empty()) {
                Value sub = strip_nulls(val);
                if (!sub.empty()) {
                    stripped[it.key()] = std::move(sub);
                }
                continue;
            }
            stripped[it.key()] = val;
        }

        return stripped;
    }

    /**
     * @brief Remove the parts of an intended change that current already has
     *
     * - Deletion: kept only if current still has the key
     * - Scalar or array: kept only if current holds a different value
     * - Object over an object: filtered recursively
     * - Object over anything else: kept without its deletions
     */
    Value unsatisfied(const Value& intent, const Value& current) {
        Value patch = Value::object();

        for (auto it = intent.begin(); it != intent.end(); ++it) {
            const auto& key = it.key();
            const auto& want = it.value();

            const Value* live = nullptr;
            if (current.is_object()) {
                auto found = current.find(key);
                if (found != current.end()) {
                    live = &*found;
                }
            }

            if (want.is_null()) {
                if (live != nullptr) {
                    patch[key] = nullptr;
                }
                continue;
            }

            if (want.is_object()) {
                if (live != nullptr && live->is_object()) {
                    Value sub = unsatisfied(want, *live);
                    if (!sub.empty()) {
                        patch[key] = std::move(sub);
                    }
                    continue;
                }
                Value sub = strip_nulls(want);
                if (want.empty() || !sub.empty()) {
                    patch[key] = std::move(sub);
                }
                continue;
            }

            if (live == nullptr || *live != want) {
                patch[key] = want;
            }
        }

        return patch;
    }

    template <typename Error>
    Value parse_document(const std::string& bytes, const char* step) {
        try {
            return Value::parse(bytes);
        } catch (const Value::parse_error& e) {
            throw Error(step, e.what());
        }
    }

    /**
     * @brief Parse a three-way input, treating an absent document as {}
     */
    Value parse_three_way_input(const std::string& bytes, const char* step) {
        if (bytes.empty()) {
            return Value::object();
        }
        return parse_document<PatchGenerationError>(bytes, step);
    }

} // anonymous namespace

Value create_merge_patch(const Value& from, const Value& to) {
    return diff_objects(require_object(from, "source"), require_object(to, "target"));
}

Value create_three_way_merge_patch(const Value& original,
                                   const Value& modified,
                                   const Value& current) {
    // What the user changed between the last applied and the desired state
    Value intent = create_merge_patch(original, modified);

    return unsatisfied(intent, require_object(current, "current"));
}

Value apply_merge_patch(const Value& document, const Value& patch) {
    Value result = document;
    result.merge_patch(patch);
    return result;
}

// ============================================================================
// BaseJsonMergePatcher
// ============================================================================

std::string BaseJsonMergePatcher::create_merge_patch(const std::string& from,
                                                     const std::string& to) const {
    Value from_doc = parse_document<PatchGenerationError>(from, "parse source document");
    Value to_doc = parse_document<PatchGenerationError>(to, "parse target document");
    return patchmaker::create_merge_patch(from_doc, to_doc).dump();
}

std::string BaseJsonMergePatcher::create_three_way_json_merge_patch(
        const std::string& original,
        const std::string& modified,
        const std::string& current) const {
    Value original_doc = parse_three_way_input(original, "parse original document");
    Value modified_doc = parse_three_way_input(modified, "parse modified document");
    Value current_doc = parse_three_way_input(current, "parse current document");
    return create_three_way_merge_patch(original_doc, modified_doc, current_doc).dump();
}

std::string BaseJsonMergePatcher::merge_patch(const std::string& document,
                                              const std::string& patch) const {
    Value doc = parse_document<PatchApplyError>(document, "parse document");
    Value patch_doc = parse_document<PatchApplyError>(patch, "parse patch");
    return apply_merge_patch(doc, patch_doc).dump();
}

} // namespace patchmaker
