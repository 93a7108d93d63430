#include "patchmark/parsers/structured_review_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace patchmark {

namespace {

using json = nlohmann::json;

auto string_field(const json& object, const char* key, const std::string& fallback = "")
    -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

// Integers are clamped to int; fractional values outside int, NaN and
// infinities give the fallback
auto int_field(const json& object, const char* key, int fallback) -> int {
    constexpr auto int_min = std::numeric_limits<int>::min();
    constexpr auto int_max = std::numeric_limits<int>::max();

    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<unsigned long long>();
        return value > static_cast<unsigned long long>(int_max) ? int_max : static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        return static_cast<int>(std::clamp<long long>(it->get<long long>(), int_min, int_max));
    }

    auto value = it->get<double>();
    if (!std::isfinite(value) || value < int_min || value > int_max) {
        return fallback;
    }
    return static_cast<int>(value);
}

auto fallback_review(const std::string& raw_response) -> StructuredReview {
    StructuredReview review;
    review.parse_failed = true;
    review.overall_review = OverallReview{
        .summary = "Failed to parse structured response, falling back to basic review",
        .recommendation = Recommendation::COMMENT,
        .issues_count = 0,
        .quality_score = 5};
    review.file_reviews.push_back(FileReview{
        .filename = "unknown",
        .line_comments = {LineComment{
            .line_number = 1,
            .comment = raw_response.empty() ? "No response received" : raw_response,
            .severity = "suggestion",
            .category = "maintainability"}},
        .file_summary = "Unable to parse structured review"});
    return review;
}

auto parse_line_comment(const json& object) -> LineComment {
    return LineComment{.line_number = int_field(object, "line_number", 1),
                       .comment = string_field(object, "comment"),
                       .severity = string_field(object, "severity", "suggestion"),
                       .category = string_field(object, "category", "maintainability")};
}

auto parse_file_review(const json& object) -> FileReview {
    FileReview file_review;
    file_review.filename = string_field(object, "filename");
    file_review.file_summary = string_field(object, "file_summary");

    if (auto it = object.find("line_comments"); it != object.end() && it->is_array()) {
        for (const auto& comment : *it) {
            if (comment.is_object()) {
                file_review.line_comments.push_back(parse_line_comment(comment));
            }
        }
    }
    return file_review;
}

} // namespace

auto parse_structured_review(const std::string& response) -> StructuredReview {
    auto document = json::parse(response, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return fallback_review(response);
    }

    StructuredReview review;

    if (auto it = document.find("file_reviews"); it != document.end() && it->is_array()) {
        for (const auto& file_review : *it) {
            if (file_review.is_object()) {
                review.file_reviews.push_back(parse_file_review(file_review));
            }
        }
    }

    if (auto it = document.find("overall_review"); it != document.end() && it->is_object()) {
        const auto& overall = *it;
        review.overall_review = OverallReview{
            .summary = string_field(overall, "summary"),
            .recommendation = recommendation_from_string(string_field(overall, "recommendation"))
                                  .value_or(Recommendation::COMMENT),
            .issues_count = int_field(overall, "issues_count", 0),
            .quality_score = int_field(overall, "quality_score", 0)};
    } else {
        review.overall_review = OverallReview{
            .summary = "Review completed",
            .recommendation = Recommendation::COMMENT,
            .issues_count = static_cast<int>(review.file_reviews.size()),
            .quality_score = 7};
    }

    return review;
}

auto review_to_suggestions(const StructuredReview& review) -> std::vector<Suggestion> {
    std::vector<Suggestion> suggestions;

    for (const auto& file_review : review.file_reviews) {
        std::string text = file_review.file_summary;
        for (const auto& comment : file_review.line_comments) {
            if (!text.empty()) {
                text += '\n';
            }
            text += "- line " + std::to_string(comment.line_number) + " [" + comment.severity + "/"
                    + comment.category + "]: " + comment.comment;
        }

        if (text.empty()) {
            continue;
        }

        // A file reviewed twice still gets a single comment
        auto existing = std::find_if(suggestions.begin(), suggestions.end(), [&](const Suggestion& s) {
            return s.filename == file_review.filename;
        });
        if (existing != suggestions.end()) {
            existing->suggestion_text += "\n\n" + text;
        } else {
            suggestions.push_back(Suggestion{.filename = file_review.filename, .suggestion_text = text});
        }
    }

    return suggestions;
}

auto recommendation_from_string(const std::string& text) -> std::optional<Recommendation> {
    if (text == "APPROVE") return Recommendation::APPROVE;
    if (text == "REQUEST_CHANGES") return Recommendation::REQUEST_CHANGES;
    if (text == "COMMENT") return Recommendation::COMMENT;
    return std::nullopt;
}

auto recommendation_name(Recommendation recommendation) -> std::string {
    switch (recommendation) {
    case Recommendation::APPROVE:
        return "APPROVE";
    case Recommendation::REQUEST_CHANGES:
        return "REQUEST_CHANGES";
    case Recommendation::COMMENT:
        return "COMMENT";
    }
    return "COMMENT";
}

} // namespace patchmark
