#include "patchmark/core/batch_scheduler.hpp"

namespace patchmark {

auto schedule_batches(std::span<const FilePatch> eligible, size_t budget) -> std::vector<Batch> {
    std::vector<Batch> batches;
    Batch current;

    for (const auto& file : eligible) {
        if (!current.files.empty() && current.total_units + file.units_used > budget) {
            batches.push_back(std::move(current));
            current = Batch{};
        }
        current.files.push_back(file);
        current.total_units += file.units_used;
    }

    if (!current.files.empty()) {
        batches.push_back(std::move(current));
    }

    return batches;
}

auto concatenate_patches(const Batch& batch) -> std::string {
    std::string text;
    for (const auto& file : batch.files) {
        text += file.filename;
        text += '\n';
        text += file.raw_patch;
        if (!file.raw_patch.empty() && file.raw_patch.back() != '\n') {
            text += '\n';
        }
    }
    return text;
}

} // namespace patchmark
