#include "align/sequential_aligner.hpp"
#include <algorithm>

namespace sttmon {
namespace align {

SequentialAligner::SequentialAligner(int maxLookahead)
    : maxLookahead_(std::max(1, maxLookahead)) {
}

CharacterAlignment SequentialAligner::align(const std::u32string& reference,
                                            const std::u32string& hypothesis) const {
    CharacterAlignment result;
    result.states.assign(reference.size(), CharacterState::PENDING);
    
    const size_t lookahead = static_cast<size_t>(maxLookahead_);
    size_t refIdx = 0;
    size_t hypIdx = 0;
    
    while (refIdx < reference.size() && hypIdx < hypothesis.size()) {
        if (reference[refIdx] == hypothesis[hypIdx]) {
            result.states[refIdx] = CharacterState::HIT;
            ++refIdx;
            ++hypIdx;
            continue;
        }
        
        // Reference skipped ahead: the speaker dropped some characters
        bool resynced = false;
        for (size_t look = 1; look <= lookahead; ++look) {
            if (refIdx + look < reference.size() && reference[refIdx + look] == hypothesis[hypIdx]) {
                std::fill(result.states.begin() + refIdx,
                          result.states.begin() + refIdx + look,
                          CharacterState::DEL);
                refIdx += look;
                resynced = true;
                break;
            }
        }
        if (resynced) {
            continue;
        }
        
        // Hypothesis skipped ahead: extra characters are recognizer noise
        for (size_t look = 1; look <= lookahead; ++look) {
            if (hypIdx + look < hypothesis.size() && hypothesis[hypIdx + look] == reference[refIdx]) {
                hypIdx += look;
                resynced = true;
                break;
            }
        }
        if (resynced) {
            continue;
        }
        
        result.states[refIdx] = CharacterState::SUB;
        ++refIdx;
        ++hypIdx;
    }
    
    result.lastProcessedIndex = findLastProcessedIndex(result.states);
    return result;
}

} // namespace align
} // namespace sttmon
