#include "align/text_normalizer.hpp"
#include "utils/utf8_utils.hpp"
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <unordered_map>

namespace sttmon {
namespace align {

namespace {

const std::unordered_map<std::u32string, uint64_t>& digitWords() {
    static const std::unordered_map<std::u32string, uint64_t> table = {
        {U"영", 0}, {U"공", 0}, {U"빵", 0},
        {U"일", 1}, {U"하나", 1}, {U"한", 1},
        {U"이", 2}, {U"둘", 2}, {U"두", 2},
        {U"삼", 3}, {U"셋", 3}, {U"세", 3},
        {U"사", 4}, {U"넷", 4}, {U"네", 4},
        {U"오", 5}, {U"다섯", 5},
        {U"육", 6}, {U"여섯", 6},
        {U"칠", 7}, {U"일곱", 7},
        {U"팔", 8}, {U"여덟", 8},
        {U"구", 9}, {U"아홉", 9},
    };
    return table;
}

const std::unordered_map<std::u32string, uint64_t>& unitWords() {
    static const std::unordered_map<std::u32string, uint64_t> table = {
        {U"십", 10ULL}, {U"백", 100ULL}, {U"천", 1000ULL},
        {U"만", 10000ULL}, {U"억", 100000000ULL}, {U"조", 1000000000000ULL},
    };
    return table;
}

constexpr uint64_t kLargeUnitThreshold = 10000;

enum class WordKind { NONE, DIGIT, UNIT };

struct WordMatch {
    WordKind kind = WordKind::NONE;
    uint64_t value = 0;
    size_t length = 0;
};

// Two-character words win over one-character words (일곱 before 일)
WordMatch matchWord(const std::u32string& text, size_t pos) {
    for (size_t length : {size_t(2), size_t(1)}) {
        if (pos + length > text.size()) {
            continue;
        }
        std::u32string candidate = text.substr(pos, length);
        auto digit = digitWords().find(candidate);
        if (digit != digitWords().end()) {
            return WordMatch{WordKind::DIGIT, digit->second, length};
        }
        auto unit = unitWords().find(candidate);
        if (unit != unitWords().end()) {
            return WordMatch{WordKind::UNIT, unit->second, length};
        }
    }
    return WordMatch{};
}

bool checkedAdd(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

bool checkedMultiply(uint64_t a, uint64_t b, uint64_t& out) {
    if (b != 0 && a > std::numeric_limits<uint64_t>::max() / b) {
        return false;
    }
    out = a * b;
    return true;
}

std::u32string toDecimal(uint64_t value) {
    std::u32string digits;
    for (char c : std::to_string(value)) {
        digits.push_back(static_cast<char32_t>(c));
    }
    return digits;
}

} // namespace

std::string TextNormalizer::normalize(const std::string& text) const {
    std::u32string canonical = canonicalize(text);
    std::u32string result;
    result.reserve(canonical.size());
    
    bool pendingSpace = false;
    for (char32_t codepoint : canonical) {
        if (utils::isWhitespace(codepoint)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(U' ');
            pendingSpace = false;
        }
        result.push_back(codepoint);
    }
    return utils::encodeUtf8(result);
}

std::string TextNormalizer::normalizeNoSpace(const std::string& text) const {
    return utils::encodeUtf8(normalizeNoSpaceCodepoints(text));
}

std::u32string TextNormalizer::normalizeNoSpaceCodepoints(const std::string& text) const {
    std::u32string canonical = canonicalize(text);
    std::u32string result;
    result.reserve(canonical.size());
    for (char32_t codepoint : canonical) {
        if (!utils::isWhitespace(codepoint)) {
            result.push_back(codepoint);
        }
    }
    return result;
}

std::string TextNormalizer::convertKoreanNumerals(const std::string& text) const {
    return utils::encodeUtf8(convertRuns(utils::decodeUtf8(text)));
}

std::string TextNormalizer::koreanToNumber(const std::string& text) {
    return utils::encodeUtf8(koreanToNumber(utils::decodeUtf8(text)));
}

bool TextNormalizer::isPunctuation(char32_t codepoint) {
    switch (codepoint) {
        case U'.': case U',': case U'?': case U'!': case U';': case U':':
        case U'"': case U'\'': case U'-':
        case U'…': case U'·':
        case U'(': case U')': case U'[': case U']':
        case U'「': case U'」': case U'『': case U'』':
        case U'《': case U'》': case U'<': case U'>':
            return true;
        default:
            return false;
    }
}

// Numeral conversion followed by punctuation removal; whitespace is kept
std::u32string TextNormalizer::canonicalize(const std::string& text) const {
    std::u32string converted = convertRuns(utils::decodeUtf8(text));
    std::u32string result;
    result.reserve(converted.size());
    for (char32_t codepoint : converted) {
        if (!isPunctuation(codepoint)) {
            result.push_back(codepoint);
        }
    }
    return result;
}

std::u32string TextNormalizer::convertRuns(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    
    size_t pos = 0;
    while (pos < text.size()) {
        size_t runEnd = pos;
        for (WordMatch match = matchWord(text, runEnd); match.kind != WordKind::NONE;
             match = matchWord(text, runEnd)) {
            runEnd += match.length;
        }
        
        if (runEnd == pos) {
            result.push_back(text[pos]);
            ++pos;
            continue;
        }
        
        result += koreanToNumber(text.substr(pos, runEnd - pos));
        pos = runEnd;
    }
    
    return result;
}

std::u32string TextNormalizer::koreanToNumber(const std::u32string& text) {
    uint64_t accumulator = 0;
    uint64_t pendingDigit = 0;
    bool hasPendingDigit = false;
    
    size_t pos = 0;
    while (pos < text.size()) {
        WordMatch match = matchWord(text, pos);
        if (match.kind == WordKind::NONE) {
            return text;
        }
        pos += match.length;
        
        if (match.kind == WordKind::DIGIT) {
            pendingDigit = match.value;
            hasPendingDigit = true;
            continue;
        }
        
        if (match.value < kLargeUnitThreshold) {
            // 십/백/천 scale the pending digit into the running segment
            uint64_t digit = hasPendingDigit ? pendingDigit : 1;
            if (!checkedAdd(accumulator, digit * match.value, accumulator)) {
                return text;
            }
        } else {
            // 만/억/조 scale everything accumulated so far
            uint64_t base = 0;
            if (!checkedAdd(accumulator, hasPendingDigit ? pendingDigit : 0, base)) {
                return text;
            }
            if (base == 0 && !hasPendingDigit) {
                base = 1;
            }
            if (!checkedMultiply(base, match.value, accumulator)) {
                return text;
            }
        }
        pendingDigit = 0;
        hasPendingDigit = false;
    }
    
    uint64_t value = 0;
    if (!checkedAdd(accumulator, hasPendingDigit ? pendingDigit : 0, value) || value == 0) {
        return text;
    }
    return toDecimal(value);
}

} // namespace align
} // namespace sttmon
