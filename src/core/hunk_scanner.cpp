#include "patchmark/core/hunk_scanner.hpp"
#include "patchmark/string_utils.hpp"
#include <limits>
#include <regex>

namespace patchmark {

namespace {

// Counts are optional in unified diffs and default to 1
const std::regex hunk_header_pattern{R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@.*$)"};

auto to_count(const std::ssub_match& group) -> int {
    return group.matched && group.length() > 0 ? std::stoi(group.str()) : 1;
}

} // namespace

auto parse_hunk_header(const std::string& line) -> std::optional<HunkHeader> {
    std::smatch match;
    if (!std::regex_match(line, match, hunk_header_pattern)) {
        return std::nullopt;
    }

    try {
        HunkHeader header{.old_start = std::stoi(match[1].str()),
                          .old_count = to_count(match[2]),
                          .new_start = std::stoi(match[3].str()),
                          .new_count = to_count(match[4])};

        // "+0,0" is a whole-file deletion; any other zero start is bogus
        if (header.new_start == 0 && header.new_count != 0) {
            return std::nullopt;
        }
        if (static_cast<long long>(header.new_start) + header.new_count
            > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return header;
    } catch (const std::exception&) {
        // Out of range for int
        return std::nullopt;
    }
}

auto is_file_boundary(const std::string& line) -> bool {
    if (line.empty()) {
        return false;
    }
    // Hunk body lines always start with one of these
    switch (line.front()) {
    case ' ':
    case '+':
    case '-':
    case '\\':
    case '@':
        return false;
    default:
        break;
    }
    return !line.starts_with("diff ") && !line.starts_with("index ");
}

auto scan_markers(std::span<const std::string> lines) -> std::vector<ScanMarker> {
    std::vector<ScanMarker> markers;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.starts_with("@@")) {
            auto kind = parse_hunk_header(line) ? MarkerKind::HUNK_HEADER
                                                : MarkerKind::MALFORMED_HEADER;
            markers.push_back(ScanMarker{.kind = kind, .line_index = i});
        } else if (is_file_boundary(line)) {
            markers.push_back(ScanMarker{.kind = MarkerKind::FILE_BOUNDARY, .line_index = i});
        }
    }

    return markers;
}

auto scan_hunks(std::string_view patch) -> ScanResult {
    const auto lines = StringUtils::split_lines(patch);
    const auto markers = scan_markers(lines);

    ScanResult result;
    result.segments.push_back(PatchSegment{});

    for (size_t m = 0; m < markers.size(); ++m) {
        const auto& marker = markers[m];
        size_t body_end = m + 1 < markers.size() ? markers[m + 1].line_index : lines.size();

        switch (marker.kind) {
        case MarkerKind::FILE_BOUNDARY:
            result.segments.push_back(PatchSegment{.filename = lines[marker.line_index], .hunks = {}});
            break;

        case MarkerKind::MALFORMED_HEADER:
            ++result.skipped_hunks;
            break;

        case MarkerKind::HUNK_HEADER: {
            Hunk hunk;
            hunk.header = *parse_hunk_header(lines[marker.line_index]);
            hunk.body.assign(lines.begin() + static_cast<std::ptrdiff_t>(marker.line_index + 1),
                             lines.begin() + static_cast<std::ptrdiff_t>(body_end));
            result.segments.back().hunks.push_back(std::move(hunk));
            break;
        }
        }
    }

    // Drop the unnamed leading segment when the buffer starts with a file boundary
    if (result.segments.size() > 1 && result.segments.front().hunks.empty()) {
        result.segments.erase(result.segments.begin());
    }

    return result;
}

} // namespace patchmark
