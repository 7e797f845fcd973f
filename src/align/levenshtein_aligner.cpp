#include "align/levenshtein_aligner.hpp"
#include <algorithm>
#include <utility>

namespace sttmon {
namespace align {

namespace {

enum class EditOp { EQUAL, SUBSTITUTE, DELETE, INSERT };

} // namespace

CharacterAlignment LevenshteinAligner::align(const std::u32string& reference,
                                             const std::u32string& hypothesis) const {
    CharacterAlignment result;
    result.states.assign(reference.size(), CharacterState::PENDING);
    if (reference.empty() || hypothesis.empty()) {
        return result;
    }
    
    const size_t n = reference.size();
    const size_t m = hypothesis.size();
    const size_t width = m + 1;
    std::vector<int> cost((n + 1) * width, 0);
    
    for (size_t i = 0; i <= n; ++i) cost[i * width] = static_cast<int>(i);
    for (size_t j = 0; j <= m; ++j) cost[j] = static_cast<int>(j);
    
    for (size_t i = 1; i <= n; ++i) {
        for (size_t j = 1; j <= m; ++j) {
            int diagonal = cost[(i - 1) * width + (j - 1)] +
                           (reference[i - 1] == hypothesis[j - 1] ? 0 : 1);
            int deletion = cost[(i - 1) * width + j] + 1;
            int insertion = cost[i * width + (j - 1)] + 1;
            cost[i * width + j] = std::min({diagonal, deletion, insertion});
        }
    }
    
    // Backtrace, preferring match/substitute, then delete, then insert.
    // While the hypothesis is exhausted deletions come first, so the unspoken
    // tail of the script stays behind the last hypothesis character.
    std::vector<std::pair<EditOp, size_t>> ops;
    ops.reserve(n + m);
    size_t i = n;
    size_t j = m;
    while (i > 0 || j > 0) {
        int current = cost[i * width + j];
        if (j == m && i > 0 && current == cost[(i - 1) * width + j] + 1) {
            ops.emplace_back(EditOp::DELETE, i - 1);
            --i;
            continue;
        }
        if (i > 0 && j > 0) {
            bool same = reference[i - 1] == hypothesis[j - 1];
            if (current == cost[(i - 1) * width + (j - 1)] + (same ? 0 : 1)) {
                ops.emplace_back(same ? EditOp::EQUAL : EditOp::SUBSTITUTE, i - 1);
                --i;
                --j;
                continue;
            }
        }
        if (i > 0 && current == cost[(i - 1) * width + j] + 1) {
            ops.emplace_back(EditOp::DELETE, i - 1);
            --i;
            continue;
        }
        ops.emplace_back(EditOp::INSERT, i);
        --j;
    }
    std::reverse(ops.begin(), ops.end());
    
    size_t lastNonDelete = ops.size();
    for (size_t k = 0; k < ops.size(); ++k) {
        if (ops[k].first != EditOp::DELETE) {
            lastNonDelete = k;
        }
    }
    
    for (size_t k = 0; k < ops.size(); ++k) {
        const EditOp op = ops[k].first;
        const size_t refPos = ops[k].second;
        switch (op) {
            case EditOp::EQUAL:
                result.states[refPos] = CharacterState::HIT;
                break;
            case EditOp::SUBSTITUTE:
                result.states[refPos] = CharacterState::SUB;
                break;
            case EditOp::DELETE:
                // Trailing deletions have simply not been spoken yet
                if (lastNonDelete != ops.size() && k < lastNonDelete) {
                    result.states[refPos] = CharacterState::DEL;
                }
                break;
            case EditOp::INSERT:
                break;
        }
    }
    
    result.lastProcessedIndex = findLastProcessedIndex(result.states);
    return result;
}

} // namespace align
} // namespace sttmon
