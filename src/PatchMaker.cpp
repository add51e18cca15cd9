/**
 * @file PatchMaker.cpp
 * @brief Three-way merge patch verification
 */

#include "patchmaker/PatchMaker.hpp"

#include <exception>
#include <stdexcept>

namespace patchmaker {

namespace {

    template <typename Error>
    [[noreturn]] void fail(const char* step, const std::exception& cause) {
        Logger::Error("failed to {}: {}", step, cause.what());
        throw Error(step, cause.what());
    }

} // anonymous namespace

PatchMaker::PatchMaker(std::shared_ptr<const JsonMergePatcher> json_merge_patcher)
    : json_merge_patcher_(std::move(json_merge_patcher)) {
    if (!json_merge_patcher_) {
        throw std::invalid_argument("PatchMaker requires a JSON merge patcher");
    }
}

std::pair<std::string, std::string> PatchMaker::json_merge_patch(const std::string& original,
                                                                 const std::string& modified,
                                                                 const std::string& current,
                                                                 const std::string& pristine) const {
    std::string patch;
    try {
        patch = json_merge_patcher_->create_three_way_json_merge_patch(original, modified, current);
    } catch (const std::exception& e) {
        fail<PatchGenerationError>("generate merge patch", e);
    }
    Logger::Debug("three-way merge patch: {}", patch);

    if (patch == kEmptyPatch) {
        return {patch, pristine};
    }

    // Apply the patch to current and diff again to see what effectively changed
    std::string applied;
    try {
        applied = json_merge_patcher_->merge_patch(current, patch);
    } catch (const std::exception& e) {
        fail<PatchApplyError>("merge generated patch to current object", e);
    }

    try {
        patch = json_merge_patcher_->create_merge_patch(current, applied);
    } catch (const std::exception& e) {
        fail<PatchGenerationError>("create patch between the current and patched current object", e);
    }
    Logger::Debug("verified merge patch: {}", patch);

    // Re-anchor on the document before options so masked fields are kept
    std::string patched_current;
    try {
        patched_current = json_merge_patcher_->merge_patch(pristine, patch);
    } catch (const std::exception& e) {
        fail<PatchApplyError>("apply patch", e);
    }

    return {patch, patched_current};
}

const PatchMaker& default_patch_maker() {
    static const PatchMaker maker(std::make_shared<BaseJsonMergePatcher>());
    return maker;
}

} // namespace patchmaker
