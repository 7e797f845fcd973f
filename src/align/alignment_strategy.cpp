#include "align/alignment_strategy.hpp"
#include "align/levenshtein_aligner.hpp"
#include "align/sequential_aligner.hpp"
#include "utils/error_handler.hpp"

namespace sttmon {
namespace align {

int findLastProcessedIndex(const std::vector<CharacterState>& states) {
    for (size_t i = states.size(); i > 0; --i) {
        if (states[i - 1] != CharacterState::PENDING) {
            return static_cast<int>(i - 1);
        }
    }
    return -1;
}

const char* characterStateToString(CharacterState state) {
    switch (state) {
        case CharacterState::HIT: return "hit";
        case CharacterState::SUB: return "sub";
        case CharacterState::DEL: return "del";
        case CharacterState::PENDING: return "pending";
    }
    return "pending";
}

std::shared_ptr<const AlignmentStrategy> createAlignmentStrategy(const std::string& name,
                                                                 int maxLookahead) {
    if (name.empty() || name == "sequential") {
        return std::make_shared<SequentialAligner>(maxLookahead);
    }
    if (name == "levenshtein") {
        return std::make_shared<LevenshteinAligner>();
    }
    throw utils::ConfigurationException("Unknown alignment strategy '" + name + "'",
                                        "ALIGN_STRATEGY");
}

} // namespace align
} // namespace sttmon
