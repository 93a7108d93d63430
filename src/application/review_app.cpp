#include "patchmark/application/review_app.hpp"
#include "patchmark/core/batch_scheduler.hpp"
#include "patchmark/core/line_classifier.hpp"
#include "patchmark/core/token_estimator.hpp"
#include "patchmark/parsers/structured_review_parser.hpp"
#include "patchmark/parsers/suggestion_parser.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace patchmark {

namespace {

auto describe_candidates(const std::vector<PlacementCandidate>& candidates) -> std::string {
    std::string text;
    for (const auto& candidate : candidates) {
        if (!text.empty()) {
            text += ", ";
        }
        text += describe_candidate(candidate);
    }
    return text;
}

} // namespace

ReviewApp::ReviewApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IDiffParser> parser,
                     std::unique_ptr<IGenerationBackend> backend,
                     std::unique_ptr<ICommentPoster> poster, std::unique_ptr<IPacer> pacer)
    : filesystem_(std::move(filesystem)), parser_(std::move(parser)), backend_(std::move(backend)),
      poster_(std::move(poster)), pacer_(std::move(pacer)) {}

auto ReviewApp::run(const Config& config) -> int {
    if (config.input_file != "-" && !filesystem_->file_exists(config.input_file)) {
        std::cerr << "Error: Input file does not exist: " << config.input_file << "\n";
        return 1;
    }

    auto changed = load_changed_files(config);
    if (!changed) {
        std::cerr << "Error: Could not read diff from " << config.input_file << "\n";
        return 1;
    }

    return review(config, *changed) ? 0 : 1;
}

auto ReviewApp::review(const Config& config, const std::vector<ChangedFile>& changed)
    -> std::optional<RunSummary> {
    // Preconditions: nothing is printed or dispatched when these fail
    if (auto error = validate_config(config)) {
        std::cerr << "Error: " << *error << "\n";
        return std::nullopt;
    }
    if (changed.empty()) {
        std::cerr << "Error: No changed files found in the diff\n";
        return std::nullopt;
    }

    std::cout << "Found " << changed.size() << " changed files.\n";

    auto plan = plan_review(config, changed);
    size_t budget = unit_budget(config);

    RunSummary summary;
    summary.changed_files = changed.size();
    summary.missing_files = plan.estimates.missing.size();
    summary.rejected_files = plan.gate.rejected.size();
    summary.batches = plan.batches.size();

    if (!plan.gate.rejected.empty()) {
        std::cout << "Skipped " << plan.gate.rejected.size() << " files exceeding " << budget
                  << " units:\n";
        for (size_t i = 0; i < plan.gate.rejected.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << plan.gate.rejected[i] << "\n";
        }
        if (config.show_skipped_notice && !config.dry_run) {
            post_skipped_notice(plan.gate.rejected, budget);
        }
    }

    if (plan.gate.eligible.empty()) {
        std::cout << "No files to review - all files were too large or had no changes.\n";
        return summary;
    }

    std::cout << "Processing " << plan.gate.eligible.size() << " files in " << plan.batches.size()
              << " batches.\n";

    if (config.dry_run) {
        print_plan(plan);
        std::cout << "Dry run - no requests sent.\n";
        return summary;
    }

    // Sequential queue: a batch is dispatched only after the previous one has
    // been fully placed, and never sooner than batch_delay after it.
    for (size_t i = 0; i < plan.batches.size(); ++i) {
        if (i > 0) {
            std::cout << "Waiting " << config.batch_delay.count() << " ms before the next batch.\n";
            pacer_->wait(config.batch_delay);
        }

        const auto& batch = plan.batches[i];
        std::cout << "Processing batch " << (i + 1) << "/" << plan.batches.size() << " ("
                  << batch.files.size() << " files, " << batch.total_units << " units)\n";
        process_batch(batch, config, summary);
    }

    show_summary(summary);
    return summary;
}

auto ReviewApp::load_changed_files(const Config& config)
    -> std::optional<std::vector<ChangedFile>> {
    auto text = filesystem_->read_text(config.input_file);
    if (!text) {
        return std::nullopt;
    }
    return parser_->parse_diff(*text);
}

auto ReviewApp::plan_review(const Config& config, const std::vector<ChangedFile>& changed)
    -> ReviewPlan {
    auto estimator = make_estimator(config.estimator);
    size_t budget = unit_budget(config);

    ReviewPlan plan;
    plan.estimates = estimate_files(changed, *estimator);
    plan.gate = filter_by_budget(plan.estimates.files, budget);
    plan.batches = schedule_batches(plan.gate.eligible, budget);

    for (const auto& filename : plan.estimates.missing) {
        std::cout << "  " << filename << ": no patch text, omitted\n";
    }
    for (const auto& file : plan.estimates.files) {
        bool included = file.units_used <= budget;
        std::cout << "  " << file.filename << ": " << file.raw_patch.size() << " characters, "
                  << file.units_used << " units, " << (included ? "included" : "skipped") << "\n";
    }

    return plan;
}

auto ReviewApp::print_plan(const ReviewPlan& plan) -> void {
    for (size_t i = 0; i < plan.batches.size(); ++i) {
        const auto& batch = plan.batches[i];
        std::cout << "Batch " << (i + 1) << "/" << plan.batches.size() << ": "
                  << batch.files.size() << " files, " << batch.total_units << " units\n";

        for (const auto& file : batch.files) {
            auto summary = summarize_patch(file.raw_patch);
            std::cout << "  " << file.filename << " (" << file.units_used
                      << " units, first changed line " << summary.first_changed_line << ")\n";
            std::cout << "    candidates: " << describe_candidates(resolve_for_patch(file.raw_patch))
                      << "\n";
        }
    }
}

auto ReviewApp::process_batch(const Batch& batch, const Config& config, RunSummary& summary)
    -> void {
    std::string response;
    try {
        response = backend_->request_review(concatenate_patches(batch));
    } catch (const std::exception& e) {
        std::cerr << "Error: Generation request failed: " << e.what() << "\n";
        ++summary.failed_batches;
        return;
    }

    auto suggestions = suggestions_from_response(response, config, summary);

    for (const auto& suggestion : suggestions) {
        bool in_batch = std::any_of(batch.files.begin(), batch.files.end(), [&](const FilePatch& f) {
            return f.filename == suggestion.filename;
        });
        if (!in_batch) {
            std::cerr << "Warning: Suggestion for " << suggestion.filename
                      << " does not match any file in this batch\n";
        }
    }

    // One file's failure never stops the rest of the batch
    for (const auto& file : batch.files) {
        auto match = std::find_if(suggestions.begin(), suggestions.end(),
                                  [&](const Suggestion& s) { return s.filename == file.filename; });
        if (match == suggestions.end()) {
            std::cout << "  " << file.filename << ": no suggestion\n";
            continue;
        }

        ++summary.suggestions;
        try {
            auto report = place_suggestion(file, *match);
            if (report.used_sentinel()) {
                ++summary.placed_on_pull_request;
            } else if (report.succeeded()) {
                ++summary.placed_on_line;
            } else {
                ++summary.unplaced;
                std::cerr << "Error: Could not place the comment for " << file.filename
                          << " anywhere\n";
            }
        } catch (const std::exception& e) {
            ++summary.unplaced;
            std::cerr << "Error: Placing the comment for " << file.filename
                      << " failed: " << e.what() << "\n";
        }
    }
}

auto ReviewApp::suggestions_from_response(const std::string& response, const Config& config,
                                          RunSummary& summary) -> std::vector<Suggestion> {
    if (config.mode == ReviewMode::SUGGESTIONS) {
        auto suggestions = SuggestionParser{}.parse_suggestions(response);
        if (suggestions.empty() && !response.empty()) {
            ++summary.unparsed_responses;
            std::cerr << "Warning: Response contained no @@path@@ suggestions\n";
        }
        return suggestions;
    }

    auto review = parse_structured_review(response);
    if (review.parse_failed) {
        ++summary.unparsed_responses;
        std::cerr << "Warning: Failed to parse structured response, using the default review\n";
    }

    std::cout << "  Overall: " << review.overall_review.summary << " ("
              << recommendation_name(review.overall_review.recommendation) << ", quality "
              << review.overall_review.quality_score << "/10, "
              << review.overall_review.issues_count << " issues)\n";

    return review_to_suggestions(review);
}

auto ReviewApp::place_suggestion(const FilePatch& file, const Suggestion& suggestion)
    -> PlacementReport {
    auto candidates = resolve_for_patch(file.raw_patch);
    std::cout << "  " << file.filename << ": candidates " << describe_candidates(candidates) << "\n";

    auto report = attempt_placement(candidates, [&](const PlacementCandidate& candidate) {
        bool posted = candidate.is_sentinel()
                          ? poster_->post_pull_request_comment(format_pull_request_comment(suggestion))
                          : poster_->post_line_comment(file.filename, *candidate.line_number,
                                                       format_line_comment(suggestion));
        if (posted) {
            std::cout << "  Commented on " << describe_candidate(candidate) << " for "
                      << file.filename << "\n";
        } else {
            std::cerr << "Warning: Failed to comment on " << describe_candidate(candidate)
                      << " for " << file.filename << "\n";
        }
        return posted;
    });

    for (const auto& error : report.errors) {
        std::cerr << "Warning: Comment attempt for " << file.filename << " threw: " << error << "\n";
    }
    if (report.used_sentinel()) {
        std::cerr << "Warning: All line comment candidates failed for " << file.filename
                  << ", commented on the pull request instead\n";
    }

    return report;
}

auto ReviewApp::post_skipped_notice(const std::vector<std::string>& rejected, size_t budget)
    -> void {
    try {
        if (poster_->post_pull_request_comment(format_skipped_notice(rejected, budget))) {
            std::cout << "Created informational comment for " << rejected.size()
                      << " skipped files.\n";
        } else {
            std::cerr << "Error: Failed to create skipped files comment\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to create skipped files comment: " << e.what() << "\n";
    }
}

auto ReviewApp::show_summary(const RunSummary& summary) -> void {
    std::cout << "Placed " << (summary.placed_on_line + summary.placed_on_pull_request)
              << " comments (" << summary.placed_on_pull_request << " on the whole pull request).\n";
    if (summary.unplaced > 0 || summary.failed_batches > 0) {
        std::cout << summary.unplaced << " comments could not be placed, " << summary.failed_batches
                  << " batches failed.\n";
    }
}

auto format_line_comment(const Suggestion& suggestion) -> std::string {
    return "[patchmark]\n" + suggestion.suggestion_text;
}

auto format_pull_request_comment(const Suggestion& suggestion) -> std::string {
    return "[patchmark] " + suggestion.filename + "\n" + suggestion.suggestion_text;
}

auto format_skipped_notice(const std::vector<std::string>& rejected, size_t budget) -> std::string {
    std::ostringstream oss;
    oss << "Files skipped\n\n";
    oss << "The following " << rejected.size()
        << " file(s) were skipped from automated review because they exceed the token limit ("
        << budget << " tokens):\n\n";
    for (const auto& filename : rejected) {
        oss << "- " << filename << "\n";
    }
    return oss.str();
}

} // namespace patchmark
