#include "patchmark/parsers/diff_parser.hpp"
#include "patchmark/core/hunk_scanner.hpp"
#include "patchmark/string_utils.hpp"

namespace patchmark {

auto UnifiedDiffParser::parse_diff(const std::string& diff_text) -> std::vector<ChangedFile> {
    std::vector<ChangedFile> files;
    std::optional<PendingFile> pending;

    // Lines still owed by the current hunk, taken from its header counts
    int old_remaining = 0;
    int new_remaining = 0;

    for (const auto& line : StringUtils::split_lines(diff_text)) {
        if (pending && (old_remaining > 0 || new_remaining > 0)) {
            bool consumed = true;
            if (line.empty() || line.starts_with(' ')) {
                --old_remaining;
                --new_remaining;
            } else if (line.starts_with('-')) {
                --old_remaining;
            } else if (line.starts_with('+')) {
                --new_remaining;
            } else if (!line.starts_with('\\')) {
                // Truncated hunk: treat the line as a header below
                consumed = false;
                old_remaining = 0;
                new_remaining = 0;
            }

            if (consumed) {
                pending->patch_lines.push_back(line);
                continue;
            }
        }

        std::smatch match;
        if (std::regex_match(line, match, git_header_pattern_)) {
            flush(pending, files);
            pending = PendingFile{
                .filename = match[2].str(), .old_filename = match[1].str(), .patch_lines = {}};
        } else if (line.starts_with("--- ")) {
            // Plain "diff -u" output has no git header between files
            if (!pending || !pending->patch_lines.empty()) {
                flush(pending, files);
                pending = PendingFile{};
            }
            pending->old_filename = strip_path(line.substr(4));
            if (pending->filename.empty() && pending->old_filename != dev_null_) {
                pending->filename = pending->old_filename;
            }
        } else if (line.starts_with("+++ ")) {
            if (!pending) {
                pending = PendingFile{};
            }
            auto new_filename = strip_path(line.substr(4));
            if (new_filename != dev_null_) {
                pending->filename = new_filename;
            }
        } else if (line.starts_with("@@")) {
            if (!pending) {
                pending = PendingFile{};
            }
            pending->patch_lines.push_back(line);
            if (auto header = parse_hunk_header(line)) {
                old_remaining = header->old_count;
                new_remaining = header->new_count;
            }
        } else if (pending && line.starts_with('\\')) {
            pending->patch_lines.push_back(line);
        }
        // index, mode, rename, similarity and "Binary files" lines carry no patch text
    }

    flush(pending, files);
    return files;
}

auto UnifiedDiffParser::flush(std::optional<PendingFile>& pending, std::vector<ChangedFile>& files)
    -> void {
    if (!pending) {
        return;
    }

    auto filename = pending->filename.empty() ? pending->old_filename : pending->filename;
    files.push_back(ChangedFile{.filename = filename,
                                .patch = StringUtils::join_lines(pending->patch_lines)});
    pending.reset();
}

auto UnifiedDiffParser::strip_path(const std::string& text) -> std::string {
    // "--- a/src/x.cpp\t2024-01-01 10:00:00" -> "src/x.cpp"
    auto path = text.substr(0, text.find('\t'));
    path = StringUtils::trim(path);
    if (path.starts_with("a/") || path.starts_with("b/")) {
        path = path.substr(2);
    }
    return path;
}

} // namespace patchmark
