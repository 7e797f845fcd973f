#include "align/metrics_calculator.hpp"
#include <algorithm>
#include <numeric>

namespace sttmon {
namespace align {

PartialMetrics MetricsCalculator::compute(const std::vector<AlignedToken>& tokens,
                                          const std::vector<CharacterState>& states,
                                          int lastProcessedIndex,
                                          const std::u32string& normalizedReference,
                                          const std::u32string& normalizedHypothesis) {
    PartialMetrics metrics;
    
    for (const auto& token : tokens) {
        switch (token.type) {
            case AlignType::HIT: ++metrics.hits; break;
            case AlignType::SUB: ++metrics.substitutions; break;
            case AlignType::DEL: ++metrics.deletions; break;
            case AlignType::INS: ++metrics.insertions; break;
            case AlignType::PENDING: break;
        }
    }
    
    metrics.refProcessed = metrics.hits + metrics.substitutions + metrics.deletions;
    if (metrics.refProcessed > 0) {
        metrics.wer = static_cast<double>(metrics.substitutions + metrics.deletions + metrics.insertions) /
                      static_cast<double>(metrics.refProcessed);
    }
    
    if (lastProcessedIndex >= 0) {
        size_t prefixLength = std::min({static_cast<size_t>(lastProcessedIndex) + 1,
                                        states.size(), normalizedReference.size()});
        if (prefixLength > 0) {
            std::u32string partialReference = normalizedReference.substr(0, prefixLength);
            metrics.cer = static_cast<double>(editDistance(partialReference, normalizedHypothesis)) /
                          static_cast<double>(prefixLength);
        }
    }
    
    return metrics;
}

size_t MetricsCalculator::editDistance(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();
    
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    std::iota(previous.begin(), previous.end(), size_t(0));
    
    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({substitution, previous[j] + 1, current[j - 1] + 1});
        }
        std::swap(previous, current);
    }
    
    return previous[b.size()];
}

} // namespace align
} // namespace sttmon
