#include "patchmark/core/line_classifier.hpp"
#include <algorithm>
#include <iterator>
#include <limits>

namespace patchmark {

namespace {

auto is_file_header_line(const std::string& line) -> bool {
    return line.starts_with("+++") || line.starts_with("---");
}

auto is_addition(const std::string& line) -> bool {
    return line.starts_with('+') && !is_file_header_line(line);
}

auto first_header(const ScanResult& scan) -> std::optional<HunkHeader> {
    for (const auto& segment : scan.segments) {
        if (!segment.hunks.empty()) {
            return segment.hunks.front().header;
        }
    }
    return std::nullopt;
}

} // namespace

auto classify_hunk(const Hunk& hunk) -> std::vector<LineRecord> {
    std::vector<LineRecord> records;
    // The body may run past the header's range, so count beyond int
    long long current_line = hunk.header.new_start;
    bool addition_already_paired = false;

    for (size_t i = 0; i < hunk.body.size(); ++i) {
        const auto& line = hunk.body[i];
        if (current_line > std::numeric_limits<int>::max()) {
            break;
        }

        if (is_file_header_line(line) || line.starts_with('\\')) {
            continue;
        }

        if (line.starts_with('+')) {
            if (addition_already_paired) {
                addition_already_paired = false;
            } else {
                records.push_back(LineRecord{.line_number = static_cast<int>(current_line),
                                             .kind = LineKind::ADDED,
                                             .content = line.substr(1)});
            }
            ++current_line;
        } else if (line.starts_with('-')) {
            bool next_is_addition = i + 1 < hunk.body.size() && is_addition(hunk.body[i + 1]);
            if (next_is_addition) {
                records.push_back(LineRecord{.line_number = static_cast<int>(current_line),
                                             .kind = LineKind::MODIFIED,
                                             .content = hunk.body[i + 1].substr(1)});
                addition_already_paired = true;
            }
            // Removals never occupy a new-file line
        } else if (line.starts_with(' ') || line.empty()) {
            records.push_back(LineRecord{.line_number = static_cast<int>(current_line),
                                         .kind = LineKind::CONTEXT,
                                         .content = line.empty() ? "" : line.substr(1)});
            ++current_line;
        }
    }

    return records;
}

auto classify_patch(std::string_view patch) -> std::vector<LineRecord> {
    std::vector<LineRecord> records;
    for (const auto& segment : scan_hunks(patch).segments) {
        for (const auto& hunk : segment.hunks) {
            auto hunk_records = classify_hunk(hunk);
            records.insert(records.end(), std::make_move_iterator(hunk_records.begin()),
                           std::make_move_iterator(hunk_records.end()));
        }
    }
    return records;
}

auto classify_segments(std::string_view buffer) -> std::vector<FileLineRecords> {
    std::vector<FileLineRecords> files;
    for (const auto& segment : scan_hunks(buffer).segments) {
        FileLineRecords file{.filename = segment.filename, .records = {}};
        for (const auto& hunk : segment.hunks) {
            auto hunk_records = classify_hunk(hunk);
            file.records.insert(file.records.end(), std::make_move_iterator(hunk_records.begin()),
                                std::make_move_iterator(hunk_records.end()));
        }
        files.push_back(std::move(file));
    }
    return files;
}

auto summarize_patch(std::string_view patch) -> PatchSummary {
    PatchSummary summary;
    summary.first_changed_line = first_changed_line(patch);

    for (const auto& record : classify_patch(patch)) {
        if (record.kind == LineKind::ADDED) {
            summary.added_lines.push_back(record.line_number);
        } else if (record.kind == LineKind::MODIFIED) {
            summary.modified_lines.push_back(record.line_number);
        }
    }
    summary.has_changes = !summary.added_lines.empty() || !summary.modified_lines.empty();

    return summary;
}

auto first_changed_line(std::string_view patch) -> int {
    auto records = classify_patch(patch);
    auto changed = std::find_if(records.begin(), records.end(), [](const LineRecord& record) {
        return record.kind != LineKind::CONTEXT;
    });
    if (changed != records.end()) {
        return changed->line_number;
    }
    return default_target_line(patch).value_or(1);
}

auto default_target_line(std::string_view patch) -> std::optional<int> {
    auto header = first_header(scan_hunks(patch));
    if (!header) {
        return std::nullopt;
    }
    return std::max(header->new_start, 1);
}

} // namespace patchmark
