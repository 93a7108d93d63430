#pragma once

#include "patchmark/core/patch_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace patchmark {

enum class Recommendation { APPROVE, REQUEST_CHANGES, COMMENT };

struct OverallReview {
    std::string summary;
    Recommendation recommendation{Recommendation::COMMENT};
    int issues_count{};
    int quality_score{};
};

struct LineComment {
    int line_number{};
    std::string comment;
    std::string severity;  // "error", "warning" or "suggestion"
    std::string category;  // "bug", "security", "performance", "style" or "maintainability"
};

struct FileReview {
    std::string filename;
    std::vector<LineComment> line_comments;
    std::string file_summary;
};

struct StructuredReview {
    OverallReview overall_review;
    std::vector<FileReview> file_reviews;
    bool parse_failed{};  // True when the default result was substituted
};

// Never throws. Unparseable text yields a default review carrying the raw
// text as a single low-confidence comment; a missing overall_review or
// file_reviews is filled with defaults.
auto parse_structured_review(const std::string& response) -> StructuredReview;

// One suggestion per reviewed file with at least a summary or a comment
auto review_to_suggestions(const StructuredReview& review) -> std::vector<Suggestion>;

auto recommendation_from_string(const std::string& text) -> std::optional<Recommendation>;
auto recommendation_name(Recommendation recommendation) -> std::string;

} // namespace patchmark
