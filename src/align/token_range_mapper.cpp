#include "align/token_range_mapper.hpp"
#include "utils/utf8_utils.hpp"

namespace sttmon {
namespace align {

std::vector<TokenSpan> TokenRangeMapper::map(const std::string& reference,
                                             const TextNormalizer& normalizer) {
    std::vector<TokenSpan> spans;
    std::vector<std::string> tokens = utils::splitWhitespace(reference);
    spans.reserve(tokens.size());
    
    // Numeral runs and punctuation never cross whitespace, so normalizing
    // token by token yields the same characters as normalizing the whole text
    size_t offset = 0;
    for (auto& token : tokens) {
        TokenSpan span;
        span.start = offset;
        span.end = offset + normalizer.normalizeNoSpaceCodepoints(token).size();
        span.originalText = std::move(token);
        offset = span.end;
        spans.push_back(std::move(span));
    }
    
    return spans;
}

} // namespace align
} // namespace sttmon
