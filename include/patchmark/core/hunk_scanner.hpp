#pragma once

#include "patchmark/core/patch_types.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchmark {

enum class MarkerKind {
    HUNK_HEADER,       // Valid "@@ -o,p +n,q @@" header
    MALFORMED_HEADER,  // Starts with "@@" but fails the numeric pattern
    FILE_BOUNDARY      // Bare file path inside a concatenated buffer
};

struct ScanMarker {
    MarkerKind kind{MarkerKind::HUNK_HEADER};
    size_t line_index{};

    auto operator==(const ScanMarker& other) const -> bool = default;
};

// Hunks of one file. The filename is empty for a patch that carries no
// file boundary line.
struct PatchSegment {
    std::string filename;
    std::vector<Hunk> hunks;
};

struct ScanResult {
    std::vector<PatchSegment> segments;
    size_t skipped_hunks{};  // Malformed headers whose body was dropped
};

// nullopt when the numbers fail the pattern or the new range leaves int
auto parse_hunk_header(const std::string& line) -> std::optional<HunkHeader>;

// Any non-empty line that cannot belong to a hunk body or a diff preamble
auto is_file_boundary(const std::string& line) -> bool;

// First pass: immutable positions of every header and file boundary
auto scan_markers(std::span<const std::string> lines) -> std::vector<ScanMarker>;

// Second pass: slice the lines between markers into hunks per file segment
auto scan_hunks(std::string_view patch) -> ScanResult;

} // namespace patchmark
