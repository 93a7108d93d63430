#include "patchmark/core/patch_types.hpp"

namespace patchmark {

auto line_kind_name(LineKind kind) -> std::string {
    switch (kind) {
    case LineKind::ADDED:
        return "added";
    case LineKind::MODIFIED:
        return "modified";
    case LineKind::CONTEXT:
        return "context";
    }
    return "unknown";
}

auto tier_display_name(Tier tier) -> std::string {
    switch (tier) {
    case Tier::ADDED_LINES:
        return "Tier 1 (added lines)";
    case Tier::MODIFIED_LINES:
        return "Tier 2 (modified lines)";
    case Tier::CONTEXT_LINES:
        return "Tier 3 (context lines)";
    case Tier::WHOLE_PULL_REQUEST:
        return "Tier 4 (whole pull request)";
    }
    return "Unknown";
}

auto describe_candidate(const PlacementCandidate& candidate) -> std::string {
    if (candidate.is_sentinel() || !candidate.line_number) {
        return "whole pull request";
    }
    std::string text = std::to_string(*candidate.line_number);
    if (candidate.kind) {
        text += " (" + line_kind_name(*candidate.kind) + ")";
    }
    return text;
}

} // namespace patchmark
