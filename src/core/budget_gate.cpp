#include "patchmark/core/budget_gate.hpp"

namespace patchmark {

namespace {

auto display_filename(const std::string& filename) -> std::string {
    return filename.empty() ? "unknown file" : filename;
}

} // namespace

auto estimate_files(std::span<const ChangedFile> changed, const ITokenEstimator& estimator)
    -> EstimateResult {
    EstimateResult result;
    result.files.reserve(changed.size());

    for (const auto& file : changed) {
        if (file.patch.empty()) {
            result.missing.push_back(display_filename(file.filename));
            continue;
        }
        result.files.push_back(FilePatch{.filename = file.filename,
                                         .raw_patch = file.patch,
                                         .units_used = estimator.estimate(file.patch)});
    }

    return result;
}

auto filter_by_budget(std::span<const FilePatch> files, size_t budget) -> GateResult {
    GateResult result;

    for (const auto& file : files) {
        if (file.raw_patch.empty()) {
            continue; // Missing input is omitted, not rejected
        }
        if (file.units_used <= budget) {
            result.eligible.push_back(file);
        } else {
            result.rejected.push_back(display_filename(file.filename));
        }
    }

    return result;
}

} // namespace patchmark
