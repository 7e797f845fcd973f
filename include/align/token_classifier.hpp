#pragma once

#include "align/alignment_strategy.hpp"
#include "align/token_range_mapper.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sttmon {
namespace align {

constexpr double kDefaultSimilarityThreshold = 0.6;

enum class AlignType {
    HIT,      // matched (within the similarity threshold)
    SUB,      // misrecognized
    DEL,      // skipped inside the spoken part of the script
    INS,      // hypothesis-only token; the sequential engine never emits it
    PENDING   // not reached by the hypothesis yet
};

struct AlignedToken {
    std::string text;
    AlignType type = AlignType::PENDING;

    AlignedToken() = default;
    AlignedToken(std::string tokenText, AlignType tokenType)
        : text(std::move(tokenText)), type(tokenType) {}

    bool operator==(const AlignedToken& other) const {
        return text == other.text && type == other.type;
    }
};

const char* alignTypeToString(AlignType type);

/**
 * Folds the character states inside each token span into one verdict.
 *
 * A token with at least `threshold` of its processed characters matched is
 * accepted as HIT even if a character or two differ. Spans beyond
 * lastProcessedIndex are PENDING; a span straddling that boundary is judged
 * on its processed part only.
 */
class TokenClassifier {
public:
    static std::vector<AlignedToken> classify(const std::vector<TokenSpan>& spans,
                                              const std::vector<CharacterState>& states,
                                              int lastProcessedIndex,
                                              double threshold = kDefaultSimilarityThreshold);

    static AlignType classifySpan(const TokenSpan& span,
                                  const std::vector<CharacterState>& states,
                                  int lastProcessedIndex,
                                  double threshold);
};

} // namespace align
} // namespace sttmon
