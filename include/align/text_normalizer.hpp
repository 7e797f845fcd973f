#pragma once

#include <string>

namespace sttmon {
namespace align {

/**
 * Canonicalizes reference and hypothesis text before comparison.
 *
 * Steps, in order:
 *  1. Korean numeral runs (digit words such as 삼, 다섯, 하나 and unit words
 *     십/백/천/만/억/조) are replaced by their decimal value.
 *  2. Punctuation is stripped: . , ? ! ; : " ' - … · ( ) [ ] 「 」 『 』 《 》 < >
 *  3. Whitespace runs collapse to one space (normalize) or are removed
 *     (normalizeNoSpace).
 *
 * All operations are pure and never throw on malformed input.
 */
class TextNormalizer {
public:
    std::string normalize(const std::string& text) const;
    std::string normalizeNoSpace(const std::string& text) const;

    // Same as normalizeNoSpace, as code points; this is what the aligners consume
    std::u32string normalizeNoSpaceCodepoints(const std::string& text) const;

    // Replaces every maximal numeral run in text; other characters pass through
    std::string convertKoreanNumerals(const std::string& text) const;

    /**
     * Converts a single numeral run such as "천구백오십이" to "1952".
     * Returns the input unchanged when any character is not a numeral word,
     * when the value is zero, or when the value does not fit in 64 bits.
     */
    static std::string koreanToNumber(const std::string& text);

    static bool isPunctuation(char32_t codepoint);

private:
    std::u32string canonicalize(const std::string& text) const;
    static std::u32string convertRuns(const std::u32string& text);
    static std::u32string koreanToNumber(const std::u32string& text);
};

} // namespace align
} // namespace sttmon
