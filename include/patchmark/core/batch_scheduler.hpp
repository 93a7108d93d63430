#pragma once

#include "patchmark/core/patch_types.hpp"
#include <span>
#include <string>
#include <vector>

namespace patchmark {

// Greedy order-preserving packing. A file joins the current batch while
// total_units + units_used <= budget; otherwise it opens a new batch. Files
// are never split and no batch is empty.
auto schedule_batches(std::span<const FilePatch> eligible, size_t budget) -> std::vector<Batch>;

// Request text for one batch: each file's bare filename line followed by its
// patch. classify_segments() splits it back per file.
auto concatenate_patches(const Batch& batch) -> std::string;

} // namespace patchmark
