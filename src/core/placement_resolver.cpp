#include "patchmark/core/placement_resolver.hpp"
#include "patchmark/core/line_classifier.hpp"
#include <algorithm>
#include <array>
#include <ranges>

namespace patchmark {

namespace {

struct TierRule {
    Tier tier;
    bool (*matches)(const LineRecord&);
};

constexpr std::array<TierRule, 3> tier_order{{
    {Tier::ADDED_LINES, [](const LineRecord& r) { return r.kind == LineKind::ADDED; }},
    {Tier::MODIFIED_LINES, [](const LineRecord& r) { return r.kind == LineKind::MODIFIED; }},
    {Tier::CONTEXT_LINES, [](const LineRecord& r) { return r.kind == LineKind::CONTEXT; }},
}};

auto whole_pull_request() -> PlacementCandidate {
    return PlacementCandidate{
        .line_number = std::nullopt, .kind = std::nullopt, .tier = Tier::WHOLE_PULL_REQUEST};
}

} // namespace

auto resolve_placement(std::span<const LineRecord> records) -> std::vector<PlacementCandidate> {
    std::vector<PlacementCandidate> candidates;
    candidates.reserve(records.size() + 1);

    for (const auto& rule : tier_order) {
        auto tier_begin = candidates.size();
        for (const auto& record : records | std::views::filter(rule.matches)) {
            candidates.push_back(PlacementCandidate{
                .line_number = record.line_number, .kind = record.kind, .tier = rule.tier});
        }
        std::stable_sort(candidates.begin() + static_cast<std::ptrdiff_t>(tier_begin),
                         candidates.end(), [](const auto& a, const auto& b) {
                             return *a.line_number < *b.line_number;
                         });
    }

    candidates.push_back(whole_pull_request());
    return candidates;
}

auto resolve_for_patch(std::string_view patch) -> std::vector<PlacementCandidate> {
    auto records = classify_patch(patch);
    if (!records.empty()) {
        return resolve_placement(records);
    }

    std::vector<PlacementCandidate> candidates;
    if (auto line = default_target_line(patch)) {
        candidates.push_back(PlacementCandidate{
            .line_number = *line, .kind = LineKind::CONTEXT, .tier = Tier::CONTEXT_LINES});
    }
    candidates.push_back(whole_pull_request());
    return candidates;
}

} // namespace patchmark
