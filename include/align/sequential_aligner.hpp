#pragma once

#include "align/alignment_strategy.hpp"

namespace sttmon {
namespace align {

constexpr int kDefaultMaxLookahead = 3;

/**
 * Online, single-pass aligner with a bounded resynchronization window.
 *
 * Two cursors walk the reference and the hypothesis. On a mismatch the
 * aligner first looks up to maxLookahead characters ahead in the reference
 * (skipped reference characters become DEL), then up to maxLookahead
 * characters ahead in the hypothesis (skipped hypothesis characters are
 * dropped as noise), and otherwise records a SUB. Whatever the hypothesis
 * has not reached stays PENDING, so a repeated phrase later in the script is
 * never matched early.
 *
 * Cost is O(reference length * maxLookahead).
 */
class SequentialAligner : public AlignmentStrategy {
public:
    explicit SequentialAligner(int maxLookahead = kDefaultMaxLookahead);

    CharacterAlignment align(const std::u32string& reference,
                             const std::u32string& hypothesis) const override;
    std::string getName() const override { return "sequential"; }

    int getMaxLookahead() const { return maxLookahead_; }

private:
    int maxLookahead_;
};

} // namespace align
} // namespace sttmon
