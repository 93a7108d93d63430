#pragma once

#include "patchmark/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>

namespace patchmark {

enum class EstimatorKind {
    CHARS,   // ceil(length / chars_per_unit)
    LEXICAL  // Word, number, punctuation and whitespace pieces
};

class CharRatioEstimator : public ITokenEstimator {
public:
    explicit CharRatioEstimator(size_t chars_per_unit = 4);
    auto estimate(const std::string& text) const -> size_t override;

private:
    size_t chars_per_unit_;
};

// Counts the pieces a byte-pair encoder splits text into before merging
class LexicalEstimator : public ITokenEstimator {
public:
    auto estimate(const std::string& text) const -> size_t override;
};

auto make_estimator(EstimatorKind kind) -> std::unique_ptr<ITokenEstimator>;

auto estimator_from_string(const std::string& name) -> std::optional<EstimatorKind>;
auto estimator_name(EstimatorKind kind) -> std::string;

} // namespace patchmark
