#include "patchmark/core/token_estimator.hpp"
#include <algorithm>
#include <cctype>

namespace patchmark {

namespace {

enum class PieceClass { LETTER, DIGIT, SPACE, PUNCT };

auto classify_char(unsigned char c) -> PieceClass {
    // Bytes of multi-byte UTF-8 sequences stay inside words
    if (std::isalpha(c) || c == '_' || c >= 0x80) {
        return PieceClass::LETTER;
    }
    if (std::isdigit(c)) {
        return PieceClass::DIGIT;
    }
    if (std::isspace(c)) {
        return PieceClass::SPACE;
    }
    return PieceClass::PUNCT;
}

} // namespace

CharRatioEstimator::CharRatioEstimator(size_t chars_per_unit)
    : chars_per_unit_(std::max<size_t>(chars_per_unit, 1)) {}

auto CharRatioEstimator::estimate(const std::string& text) const -> size_t {
    return (text.size() + chars_per_unit_ - 1) / chars_per_unit_;
}

auto LexicalEstimator::estimate(const std::string& text) const -> size_t {
    size_t pieces = 0;
    std::optional<PieceClass> previous;

    for (char ch : text) {
        auto current = classify_char(static_cast<unsigned char>(ch));
        // Punctuation never merges; runs of the same class do
        if (!previous || *previous != current || current == PieceClass::PUNCT) {
            ++pieces;
        }
        previous = current;
    }

    return pieces;
}

auto make_estimator(EstimatorKind kind) -> std::unique_ptr<ITokenEstimator> {
    switch (kind) {
    case EstimatorKind::CHARS:
        return std::make_unique<CharRatioEstimator>();
    case EstimatorKind::LEXICAL:
        return std::make_unique<LexicalEstimator>();
    }
    return std::make_unique<CharRatioEstimator>();
}

auto estimator_from_string(const std::string& name) -> std::optional<EstimatorKind> {
    if (name == "chars") return EstimatorKind::CHARS;
    if (name == "lexical") return EstimatorKind::LEXICAL;
    return std::nullopt;
}

auto estimator_name(EstimatorKind kind) -> std::string {
    switch (kind) {
    case EstimatorKind::CHARS:
        return "chars";
    case EstimatorKind::LEXICAL:
        return "lexical";
    }
    return "chars";
}

} // namespace patchmark
