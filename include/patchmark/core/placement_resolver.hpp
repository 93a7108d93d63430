#pragma once

#include "patchmark/core/patch_types.hpp"
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchmark {

// Outcome of walking a candidate list against the posting mechanism
struct PlacementReport {
    std::optional<PlacementCandidate> placed;
    size_t attempts{};
    size_t failures{};
    std::vector<std::string> errors;  // what() of attempts that threw

    auto succeeded() const -> bool { return placed.has_value(); }
    auto used_sentinel() const -> bool { return placed && placed->is_sentinel(); }
    // Every line-anchored candidate was refused
    auto line_candidates_exhausted() const -> bool { return !placed || placed->is_sentinel(); }
};

// Tier 1 added, Tier 2 modified, Tier 3 context (each ascending by line),
// then the single whole pull request sentinel.
auto resolve_placement(std::span<const LineRecord> records) -> std::vector<PlacementCandidate>;

// Classifies the patch first. A patch with a header but no body lines still
// gets the header's new_start as a Tier 3 candidate.
auto resolve_for_patch(std::string_view patch) -> std::vector<PlacementCandidate>;

// Calls attempt(candidate) in order until one returns true. A throwing
// attempt counts as a refusal and does not stop the walk.
template<typename Attempt>
auto attempt_placement(std::span<const PlacementCandidate> candidates, Attempt&& attempt)
    -> PlacementReport {
    PlacementReport report;

    for (const auto& candidate : candidates) {
        ++report.attempts;
        try {
            if (attempt(candidate)) {
                report.placed = candidate;
                return report;
            }
        } catch (const std::exception& e) {
            report.errors.emplace_back(e.what());
        }
        ++report.failures;
    }

    return report;
}

} // namespace patchmark
