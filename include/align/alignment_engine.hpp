#pragma once

#include "align/alignment_strategy.hpp"
#include "align/metrics_calculator.hpp"
#include "align/text_normalizer.hpp"
#include "align/token_classifier.hpp"
#include "align/token_range_mapper.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sttmon {
namespace align {

/**
 * Reference-side preparation, done once per script: the original tokens,
 * the normalized whitespace-stripped code points and the token spans.
 * Immutable after construction.
 */
class ReferenceScript {
public:
    explicit ReferenceScript(const std::string& reference,
                             const TextNormalizer& normalizer = TextNormalizer());

    const std::string& getText() const { return text_; }
    const std::u32string& getNormalized() const { return normalized_; }
    const std::vector<TokenSpan>& getSpans() const { return spans_; }
    size_t getTokenCount() const { return spans_.size(); }
    bool empty() const { return spans_.empty(); }

private:
    std::string text_;
    std::u32string normalized_;
    std::vector<TokenSpan> spans_;
};

struct AlignmentReport {
    std::vector<AlignedToken> tokens;
    PartialMetrics metrics;
    int lastProcessedIndex = -1;

    // True once no reference token is left PENDING
    bool isComplete() const;
    size_t countOf(AlignType type) const;
};

/**
 * Scores a full hypothesis snapshot against a prepared reference. Holds no
 * mutable state: the same inputs always give the same report, and one engine
 * can be used from several threads.
 */
class AlignmentEngine {
public:
    // A null strategy selects the sequential aligner with the default lookahead
    explicit AlignmentEngine(std::shared_ptr<const AlignmentStrategy> strategy = nullptr);

    AlignmentReport score(const ReferenceScript& reference,
                          const std::string& hypothesis,
                          double threshold = kDefaultSimilarityThreshold) const;

    const AlignmentStrategy& getStrategy() const { return *strategy_; }

private:
    std::shared_ptr<const AlignmentStrategy> strategy_;
    TextNormalizer normalizer_;
};

AlignmentReport alignAndScore(const std::string& reference,
                              const std::string& hypothesis,
                              double threshold = kDefaultSimilarityThreshold);

} // namespace align
} // namespace sttmon
