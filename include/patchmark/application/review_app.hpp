#pragma once

#include "patchmark/application/config.hpp"
#include "patchmark/core/budget_gate.hpp"
#include "patchmark/core/patch_types.hpp"
#include "patchmark/core/placement_resolver.hpp"
#include "patchmark/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patchmark {

struct RunSummary {
    size_t changed_files{};
    size_t missing_files{};
    size_t rejected_files{};
    size_t batches{};
    size_t failed_batches{};
    size_t suggestions{};
    size_t placed_on_line{};
    size_t placed_on_pull_request{};
    size_t unplaced{};
    size_t unparsed_responses{};
};

// Everything decided before the first request goes out
struct ReviewPlan {
    EstimateResult estimates;
    GateResult gate;
    std::vector<Batch> batches;
};

class ReviewApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IDiffParser> parser_;
    std::unique_ptr<IGenerationBackend> backend_;
    std::unique_ptr<ICommentPoster> poster_;
    std::unique_ptr<IPacer> pacer_;

public:
    ReviewApp(std::unique_ptr<IFileSystem> filesystem,
              std::unique_ptr<IDiffParser> parser,
              std::unique_ptr<IGenerationBackend> backend,
              std::unique_ptr<ICommentPoster> poster,
              std::unique_ptr<IPacer> pacer);

    // Reads the diff named by config.input_file and reviews it. Exit code.
    auto run(const Config& config) -> int;

    // nullopt when a precondition failed and nothing was dispatched
    auto review(const Config& config, const std::vector<ChangedFile>& changed)
        -> std::optional<RunSummary>;

private:
    auto load_changed_files(const Config& config) -> std::optional<std::vector<ChangedFile>>;
    auto plan_review(const Config& config, const std::vector<ChangedFile>& changed) -> ReviewPlan;
    auto print_plan(const ReviewPlan& plan) -> void;

    auto process_batch(const Batch& batch, const Config& config, RunSummary& summary) -> void;
    auto suggestions_from_response(const std::string& response, const Config& config,
                                   RunSummary& summary) -> std::vector<Suggestion>;
    auto place_suggestion(const FilePatch& file, const Suggestion& suggestion) -> PlacementReport;

    auto post_skipped_notice(const std::vector<std::string>& rejected, size_t budget) -> void;
    auto show_summary(const RunSummary& summary) -> void;
};

// Comment bodies
auto format_line_comment(const Suggestion& suggestion) -> std::string;
auto format_pull_request_comment(const Suggestion& suggestion) -> std::string;
auto format_skipped_notice(const std::vector<std::string>& rejected, size_t budget) -> std::string;

} // namespace patchmark
