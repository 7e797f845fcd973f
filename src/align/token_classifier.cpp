#include "align/token_classifier.hpp"
#include <algorithm>

namespace sttmon {
namespace align {

const char* alignTypeToString(AlignType type) {
    switch (type) {
        case AlignType::HIT: return "hit";
        case AlignType::SUB: return "sub";
        case AlignType::DEL: return "del";
        case AlignType::INS: return "ins";
        case AlignType::PENDING: return "pending";
    }
    return "pending";
}

std::vector<AlignedToken> TokenClassifier::classify(const std::vector<TokenSpan>& spans,
                                                    const std::vector<CharacterState>& states,
                                                    int lastProcessedIndex,
                                                    double threshold) {
    std::vector<AlignedToken> tokens;
    tokens.reserve(spans.size());
    for (const auto& span : spans) {
        tokens.emplace_back(span.originalText,
                            classifySpan(span, states, lastProcessedIndex, threshold));
    }
    return tokens;
}

AlignType TokenClassifier::classifySpan(const TokenSpan& span,
                                        const std::vector<CharacterState>& states,
                                        int lastProcessedIndex,
                                        double threshold) {
    if (span.empty()) {
        return AlignType::HIT;
    }
    if (lastProcessedIndex < 0 || span.start > static_cast<size_t>(lastProcessedIndex)) {
        return AlignType::PENDING;
    }
    
    size_t hits = 0;
    size_t subs = 0;
    size_t dels = 0;
    size_t pendings = 0;
    const size_t end = std::min(span.end, states.size());
    for (size_t i = span.start; i < end; ++i) {
        switch (states[i]) {
            case CharacterState::HIT: ++hits; break;
            case CharacterState::SUB: ++subs; break;
            case CharacterState::DEL: ++dels; break;
            case CharacterState::PENDING: ++pendings; break;
        }
    }
    // Characters past the state array were never reached
    pendings += span.end - end;
    
    const size_t length = span.length();
    const size_t processed = hits + subs + dels;
    
    if (pendings > 0 && pendings < length) {
        if (processed == 0) {
            return AlignType::PENDING;
        }
        double hitRatio = static_cast<double>(hits) / static_cast<double>(processed);
        return hitRatio >= threshold ? AlignType::HIT : AlignType::SUB;
    }
    
    if (pendings == length) {
        return AlignType::PENDING;
    }
    
    double hitRatio = processed > 0 ? static_cast<double>(hits) / static_cast<double>(processed) : 0.0;
    if (hitRatio >= threshold) {
        return AlignType::HIT;
    }
    if (hits + subs > dels) {
        return AlignType::SUB;
    }
    return AlignType::DEL;
}

} // namespace align
} // namespace sttmon
