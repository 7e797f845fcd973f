#pragma once

#include <memory>
#include <string>
#include <vector>

namespace sttmon {
namespace align {

enum class CharacterState {
    HIT,
    SUB,
    DEL,
    PENDING
};

/**
 * Per-character verdicts over the normalized, whitespace-stripped reference.
 * states.size() always equals the reference length. lastProcessedIndex is the
 * highest index whose state is not PENDING, or -1 when nothing was reached.
 */
struct CharacterAlignment {
    std::vector<CharacterState> states;
    int lastProcessedIndex = -1;
};

/**
 * Character-level alignment policy. Implementations are stateless and may be
 * shared between threads.
 */
class AlignmentStrategy {
public:
    virtual ~AlignmentStrategy() = default;

    virtual CharacterAlignment align(const std::u32string& reference,
                                     const std::u32string& hypothesis) const = 0;
    virtual std::string getName() const = 0;
};

int findLastProcessedIndex(const std::vector<CharacterState>& states);

const char* characterStateToString(CharacterState state);

/**
 * Creates "sequential" (bounded lookahead, the default) or "levenshtein"
 * (optimal edit script). Throws ConfigurationException for other names.
 */
std::shared_ptr<const AlignmentStrategy> createAlignmentStrategy(const std::string& name,
                                                                 int maxLookahead = 3);

} // namespace align
} // namespace sttmon
