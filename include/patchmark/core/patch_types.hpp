#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace patchmark {

// Classification of a line in new-file coordinates
enum class LineKind {
    ADDED,     // "+" line with no paired removal
    MODIFIED,  // "-" line immediately replaced by a "+" line
    CONTEXT    // " " line or empty line
};

struct LineRecord {
    int line_number{};  // 1-based, new-file coordinate
    LineKind kind{LineKind::CONTEXT};
    std::string content;  // Diff marker stripped

    auto operator==(const LineRecord& other) const -> bool = default;
};

// Numbers from "@@ -old_start,old_count +new_start,new_count @@"
struct HunkHeader {
    int old_start{};
    int old_count{};
    int new_start{};
    int new_count{};

    auto operator==(const HunkHeader& other) const -> bool = default;
};

struct Hunk {
    HunkHeader header;
    std::vector<std::string> body;  // Raw lines between this header and the next marker
};

// One changed file as delivered by the diff source
struct ChangedFile {
    std::string filename;
    std::string patch;

    auto operator==(const ChangedFile& other) const -> bool = default;
};

struct FilePatch {
    std::string filename;
    std::string raw_patch;
    size_t units_used{};

    auto operator==(const FilePatch& other) const -> bool = default;
};

struct Batch {
    std::vector<FilePatch> files;
    size_t total_units{};
};

struct Suggestion {
    std::string filename;
    std::string suggestion_text;

    auto operator==(const Suggestion& other) const -> bool = default;
};

// Placement priority classes, tried in ascending order
enum class Tier {
    ADDED_LINES = 1,
    MODIFIED_LINES = 2,
    CONTEXT_LINES = 3,
    WHOLE_PULL_REQUEST = 4  // Sentinel: no line anchor, comment on the pull request
};

struct PlacementCandidate {
    std::optional<int> line_number;  // Empty for the whole pull request sentinel
    std::optional<LineKind> kind;
    Tier tier{Tier::WHOLE_PULL_REQUEST};

    auto is_sentinel() const -> bool { return tier == Tier::WHOLE_PULL_REQUEST; }

    auto operator==(const PlacementCandidate& other) const -> bool = default;
};

auto line_kind_name(LineKind kind) -> std::string;
auto tier_display_name(Tier tier) -> std::string;

// "12 (added)" or "whole pull request"
auto describe_candidate(const PlacementCandidate& candidate) -> std::string;

} // namespace patchmark
