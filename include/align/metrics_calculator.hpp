#pragma once

#include "align/alignment_strategy.hpp"
#include "align/token_classifier.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sttmon {
namespace align {

/**
 * Error rates over the processed part of the script only. Counts are
 * token-level; cer is character-level. insertions is always 0 for the
 * character aligners.
 */
struct PartialMetrics {
    double wer = 0.0;
    double cer = 0.0;
    size_t hits = 0;
    size_t substitutions = 0;
    size_t deletions = 0;
    size_t insertions = 0;
    size_t refProcessed = 0;
};

class MetricsCalculator {
public:
    /**
     * wer = (substitutions + deletions + insertions) / refProcessed.
     * cer = editDistance(reference[0..lastProcessedIndex], hypothesis) / (lastProcessedIndex + 1).
     * Degenerate inputs give 0 rather than an error.
     */
    static PartialMetrics compute(const std::vector<AlignedToken>& tokens,
                                  const std::vector<CharacterState>& states,
                                  int lastProcessedIndex,
                                  const std::u32string& normalizedReference,
                                  const std::u32string& normalizedHypothesis);

    // Unit-cost Levenshtein distance; an empty operand costs the other's length
    static size_t editDistance(const std::u32string& a, const std::u32string& b);
};

} // namespace align
} // namespace sttmon
