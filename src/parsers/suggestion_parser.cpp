#include "patchmark/parsers/suggestion_parser.hpp"
#include "patchmark/string_utils.hpp"
#include <algorithm>

namespace patchmark {

auto SuggestionParser::parse_suggestions(const std::string& response) const
    -> std::vector<Suggestion> {
    struct Marker {
        std::string filename;
        size_t begin{};  // Start of the marker
        size_t end{};    // First character after the marker
    };

    std::vector<Marker> markers;
    for (auto it = std::sregex_iterator(response.begin(), response.end(), marker_pattern_);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        markers.push_back(Marker{.filename = match[1].str(),
                                 .begin = static_cast<size_t>(match.position(0)),
                                 .end = static_cast<size_t>(match.position(0) + match.length(0))});
    }

    std::vector<Suggestion> suggestions;
    for (size_t i = 0; i < markers.size(); ++i) {
        size_t text_end = i + 1 < markers.size() ? markers[i + 1].begin : response.size();
        auto text = StringUtils::trim(
            std::string_view(response).substr(markers[i].end, text_end - markers[i].end));
        if (text.empty()) {
            continue;
        }

        auto existing = std::find_if(suggestions.begin(), suggestions.end(),
                                     [&](const Suggestion& s) { return s.filename == markers[i].filename; });
        if (existing != suggestions.end()) {
            existing->suggestion_text += "\n\n" + text;
        } else {
            suggestions.push_back(Suggestion{.filename = markers[i].filename, .suggestion_text = text});
        }
    }

    return suggestions;
}

} // namespace patchmark
