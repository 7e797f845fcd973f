#pragma once

#include "align/text_normalizer.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sttmon {
namespace align {

/**
 * Half-open range [start, end) of one whitespace-delimited reference token
 * inside the normalized, whitespace-stripped reference. Tokens that
 * normalize to nothing (pure punctuation) have start == end.
 */
struct TokenSpan {
    size_t start = 0;
    size_t end = 0;
    std::string originalText;

    size_t length() const { return end - start; }
    bool empty() const { return start == end; }
};

class TokenRangeMapper {
public:
    /**
     * Spans are contiguous and in token order; their lengths sum to the
     * code point length of normalizer.normalizeNoSpace(reference).
     */
    static std::vector<TokenSpan> map(const std::string& reference,
                                      const TextNormalizer& normalizer = TextNormalizer());
};

} // namespace align
} // namespace sttmon
