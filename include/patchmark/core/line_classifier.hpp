#pragma once

#include "patchmark/core/hunk_scanner.hpp"
#include "patchmark/core/patch_types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchmark {

struct FileLineRecords {
    std::string filename;
    std::vector<LineRecord> records;
};

// Digest of a single-file patch
struct PatchSummary {
    int first_changed_line{1};
    bool has_changes{};
    std::vector<int> added_lines;
    std::vector<int> modified_lines;
};

// Classify one hunk body starting at header.new_start.
// A "-" line directly followed by a "+" line yields one MODIFIED record at
// the position of the addition; the addition itself is not reported again.
auto classify_hunk(const Hunk& hunk) -> std::vector<LineRecord>;

// All hunks of all segments, in scan order
auto classify_patch(std::string_view patch) -> std::vector<LineRecord>;

// One record list per file segment of a concatenated buffer
auto classify_segments(std::string_view buffer) -> std::vector<FileLineRecords>;

auto summarize_patch(std::string_view patch) -> PatchSummary;

// First added/modified line, else the first hunk's new_start, else 1
auto first_changed_line(std::string_view patch) -> int;

// First hunk's new_start (at least 1); nullopt without a valid header
auto default_target_line(std::string_view patch) -> std::optional<int>;

} // namespace patchmark
