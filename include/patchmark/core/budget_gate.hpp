#pragma once

#include "patchmark/core/patch_types.hpp"
#include "patchmark/interfaces.hpp"
#include <span>
#include <string>
#include <vector>

namespace patchmark {

struct EstimateResult {
    std::vector<FilePatch> files;
    std::vector<std::string> missing;  // Files without patch text, never estimated
};

struct GateResult {
    std::vector<FilePatch> eligible;
    std::vector<std::string> rejected;  // Filenames over budget
};

auto estimate_files(std::span<const ChangedFile> changed, const ITokenEstimator& estimator)
    -> EstimateResult;

// Eligible iff the patch is non-empty and units_used <= budget. Input order
// is preserved in both lists.
auto filter_by_budget(std::span<const FilePatch> files, size_t budget) -> GateResult;

} // namespace patchmark
