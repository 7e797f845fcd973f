#include "align/alignment_engine.hpp"
#include "align/sequential_aligner.hpp"
#include <algorithm>
#include <utility>

namespace sttmon {
namespace align {

ReferenceScript::ReferenceScript(const std::string& reference, const TextNormalizer& normalizer)
    : text_(reference)
    , normalized_(normalizer.normalizeNoSpaceCodepoints(reference))
    , spans_(TokenRangeMapper::map(reference, normalizer)) {
}

bool AlignmentReport::isComplete() const {
    return std::none_of(tokens.begin(), tokens.end(), [](const AlignedToken& token) {
        return token.type == AlignType::PENDING;
    });
}

size_t AlignmentReport::countOf(AlignType type) const {
    return static_cast<size_t>(std::count_if(tokens.begin(), tokens.end(),
                                              [type](const AlignedToken& token) {
                                                  return token.type == type;
                                              }));
}

AlignmentEngine::AlignmentEngine(std::shared_ptr<const AlignmentStrategy> strategy)
    : strategy_(strategy ? std::move(strategy)
                         : std::make_shared<SequentialAligner>(kDefaultMaxLookahead)) {
}

AlignmentReport AlignmentEngine::score(const ReferenceScript& reference,
                                       const std::string& hypothesis,
                                       double threshold) const {
    AlignmentReport report;
    if (reference.empty()) {
        return report;
    }
    
    const std::u32string normalizedHypothesis = normalizer_.normalizeNoSpaceCodepoints(hypothesis);
    if (normalizedHypothesis.empty()) {
        report.tokens.reserve(reference.getTokenCount());
        for (const auto& span : reference.getSpans()) {
            report.tokens.emplace_back(span.originalText, AlignType::PENDING);
        }
        return report;
    }
    
    CharacterAlignment alignment = strategy_->align(reference.getNormalized(), normalizedHypothesis);
    
    report.lastProcessedIndex = alignment.lastProcessedIndex;
    report.tokens = TokenClassifier::classify(reference.getSpans(), alignment.states,
                                              alignment.lastProcessedIndex, threshold);
    report.metrics = MetricsCalculator::compute(report.tokens, alignment.states,
                                                alignment.lastProcessedIndex,
                                                reference.getNormalized(), normalizedHypothesis);
    return report;
}

AlignmentReport alignAndScore(const std::string& reference,
                              const std::string& hypothesis,
                              double threshold) {
    static const AlignmentEngine engine;
    return engine.score(ReferenceScript(reference), hypothesis, threshold);
}

} // namespace align
} // namespace sttmon
