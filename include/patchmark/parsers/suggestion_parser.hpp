#pragma once

#include "patchmark/core/patch_types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace patchmark {

// Splits a free-text generation response into per-file suggestions. Each
// suggestion starts with the file path wrapped in "@@", e.g.
//
//   @@src/app.ts@@ Prefer const here ...
//
// Text before the first marker is discarded. Repeated paths are merged in
// order of appearance, so every filename maps to exactly one suggestion.
class SuggestionParser {
public:
    auto parse_suggestions(const std::string& response) const -> std::vector<Suggestion>;

private:
    // A path has no whitespace, which keeps "@@ -1,3 +1,4 @@" from matching
    static inline const std::regex marker_pattern_{R"(@@\s*([^\s@]+)\s*@@)"};
};

} // namespace patchmark
