#pragma once

#include "align/alignment_strategy.hpp"

namespace sttmon {
namespace align {

/**
 * Optimal unit-cost alignment (full edit-distance table plus backtrace).
 * Matches become HIT, substitutions SUB and deletions DEL; inserted
 * hypothesis characters are discarded. Deletions after the last non-delete
 * operation are the part of the script not spoken yet and become PENDING.
 *
 * Needs O(reference * hypothesis) time and memory, and a repeated phrase can
 * be matched against its later occurrence. The sequential aligner is the
 * default for that reason.
 */
class LevenshteinAligner : public AlignmentStrategy {
public:
    CharacterAlignment align(const std::u32string& reference,
                             const std::u32string& hypothesis) const override;
    std::string getName() const override { return "levenshtein"; }
};

} // namespace align
} // namespace sttmon
