#pragma once

#include "patchmark/core/patch_types.hpp"
#include "patchmark/interfaces.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace patchmark {

// Splits `git diff` or `diff -u` output into one ChangedFile per file. Each
// patch starts at its first hunk header, without the file header lines, the
// way source-control hosts hand out per-file patches.
class UnifiedDiffParser : public IDiffParser {
public:
    auto parse_diff(const std::string& diff_text) -> std::vector<ChangedFile> override;

private:
    struct PendingFile {
        std::string filename;
        std::string old_filename;
        std::vector<std::string> patch_lines;
    };

    auto flush(std::optional<PendingFile>& pending, std::vector<ChangedFile>& files) -> void;
    static auto strip_path(const std::string& text) -> std::string;

    static inline const std::regex git_header_pattern_{R"(^diff --git a/(.+) b/(.+)$)"};
    static inline const std::string dev_null_ = "/dev/null";
};

} // namespace patchmark
