#include <gtest/gtest.h>
#include "align/alignment_engine.hpp"
#include "utils/utf8_utils.hpp"
#include <vector>

using namespace sttmon::align;

namespace {

std::vector<AlignType> typesOf(const AlignmentReport& report) {
    std::vector<AlignType> types;
    for (const auto& token : report.tokens) {
        types.push_back(token.type);
    }
    return types;
}

// First n code points of text
std::string prefixOf(const std::string& text, size_t n) {
    std::u32string codepoints = sttmon::utils::decodeUtf8(text);
    return sttmon::utils::encodeUtf8(codepoints.substr(0, n));
}

const AlignType HIT = AlignType::HIT;
const AlignType SUB = AlignType::SUB;
const AlignType DEL = AlignType::DEL;
const AlignType PENDING = AlignType::PENDING;

} // namespace

class AlignmentEngineTest : public ::testing::Test {
protected:
    AlignmentEngine engine;
};

TEST_F(AlignmentEngineTest, EmptyReference) {
    auto report = alignAndScore("", "오늘 날씨가");
    
    EXPECT_TRUE(report.tokens.empty());
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0);
    EXPECT_DOUBLE_EQ(report.metrics.cer, 0.0);
    EXPECT_EQ(report.metrics.refProcessed, 0u);
    EXPECT_TRUE(report.isComplete());
}

TEST_F(AlignmentEngineTest, PartialHypothesisLeavesTailPending) {
    auto report = alignAndScore("오늘 날씨가 매우 좋습니다", "오늘 날씨가");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, HIT, PENDING, PENDING}));
    EXPECT_EQ(report.metrics.refProcessed, 2u);
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0);
    EXPECT_DOUBLE_EQ(report.metrics.cer, 0.0);
    EXPECT_FALSE(report.isComplete());
    EXPECT_EQ(report.countOf(PENDING), 2u);
}

TEST_F(AlignmentEngineTest, PunctuationIsIgnored) {
    auto report = alignAndScore("안녕하세요? 반갑습니다!", "안녕하세요 반갑습니다");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, HIT}));
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0);
    EXPECT_TRUE(report.isComplete());
    EXPECT_EQ(report.tokens[0].text, "안녕하세요?");
}

TEST_F(AlignmentEngineTest, SpokenNumeralsMatchDigits) {
    auto report = alignAndScore("나이가 35살입니다", "나이가 삼십오살입니다");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, HIT}));
    EXPECT_EQ(report.tokens[1].text, "35살입니다");
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0);
}

TEST_F(AlignmentEngineTest, RepeatedPhraseStaysPending) {
    auto report = alignAndScore("가나다라 마바사 가나다라", "가나다라 마바");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, HIT, PENDING}));
}

TEST_F(AlignmentEngineTest, NumeralConversionExamples) {
    EXPECT_EQ(TextNormalizer::koreanToNumber("천구백오십이"), "1952");
    EXPECT_EQ(TextNormalizer::koreanToNumber("삼십오"), "35");
    EXPECT_EQ(TextNormalizer::koreanToNumber("이천이십오"), "2025");
}

TEST_F(AlignmentEngineTest, SkippedWordIsDeleted) {
    auto report = alignAndScore("오늘 날씨가 매우 좋습니다", "오늘 매우 좋습니다");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, DEL, HIT, HIT}));
    EXPECT_EQ(report.metrics.deletions, 1u);
    EXPECT_EQ(report.metrics.refProcessed, 4u);
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.25);
    EXPECT_DOUBLE_EQ(report.metrics.cer, 3.0 / 11.0);
    EXPECT_TRUE(report.isComplete());
}

TEST_F(AlignmentEngineTest, MisrecognizedWordIsSubstituted) {
    auto report = alignAndScore("가방 학교 바람", "가방 학생 바람");
    
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{HIT, SUB, HIT}));
    EXPECT_EQ(report.metrics.substitutions, 1u);
    EXPECT_DOUBLE_EQ(report.metrics.wer, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(report.metrics.cer, 1.0 / 6.0);
    EXPECT_EQ(report.metrics.insertions, 0u);
}

TEST_F(AlignmentEngineTest, ThresholdIsHonored) {
    auto lenient = alignAndScore("가방 학교 바람", "가방 학생 바람", 0.5);
    EXPECT_EQ(typesOf(lenient), (std::vector<AlignType>{HIT, HIT, HIT}));
    EXPECT_DOUBLE_EQ(lenient.metrics.wer, 0.0);
}

TEST_F(AlignmentEngineTest, EmptyHypothesisIsAllPending) {
    auto report = alignAndScore("가방 학교", "");
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{PENDING, PENDING}));
    EXPECT_EQ(report.lastProcessedIndex, -1);
    EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0);
    EXPECT_DOUBLE_EQ(report.metrics.cer, 0.0);
}

TEST_F(AlignmentEngineTest, PunctuationOnlyHypothesisCountsAsEmpty) {
    auto report = alignAndScore("가방 학교", " ?! ... ");
    EXPECT_EQ(typesOf(report), (std::vector<AlignType>{PENDING, PENDING}));
    EXPECT_EQ(report.metrics.refProcessed, 0u);
}

TEST_F(AlignmentEngineTest, OneTokenPerReferenceWord) {
    const std::string references[] = {
        "오늘 날씨가 매우 좋습니다",
        "안녕하세요? ... 반갑습니다!",
        "  천구백오십이년   광복  "
    };
    for (const auto& reference : references) {
        auto report = alignAndScore(reference, "오늘 완전히 다른 문장");
        EXPECT_EQ(report.tokens.size(), sttmon::utils::splitWhitespace(reference).size()) << reference;
        EXPECT_GE(report.metrics.wer, 0.0);
        EXPECT_GE(report.metrics.cer, 0.0);
    }
}

TEST_F(AlignmentEngineTest, GrowingPrefixIsMonotonicAndClean) {
    const std::string reference = "오늘 날씨가 매우 좋습니다";
    ReferenceScript script(reference);
    const size_t length = sttmon::utils::decodeUtf8(reference).size();
    
    int previous = -1;
    for (size_t n = 1; n <= length; ++n) {
        auto report = engine.score(script, prefixOf(reference, n));
        EXPECT_GE(report.lastProcessedIndex, previous) << n;
        EXPECT_DOUBLE_EQ(report.metrics.wer, 0.0) << n;
        previous = report.lastProcessedIndex;
    }
    EXPECT_EQ(previous, static_cast<int>(script.getNormalized().size()) - 1);
}

TEST_F(AlignmentEngineTest, Idempotent) {
    ReferenceScript script("오늘 날씨가 매우 좋습니다");
    auto first = engine.score(script, "오늘 날씨 매우");
    auto second = engine.score(script, "오늘 날씨 매우");
    
    EXPECT_EQ(first.tokens, second.tokens);
    EXPECT_EQ(first.lastProcessedIndex, second.lastProcessedIndex);
    EXPECT_DOUBLE_EQ(first.metrics.wer, second.metrics.wer);
    EXPECT_DOUBLE_EQ(first.metrics.cer, second.metrics.cer);
}

TEST_F(AlignmentEngineTest, ReferenceScriptPreparation) {
    ReferenceScript script("나이가 35살입니다");
    
    EXPECT_EQ(script.getTokenCount(), 2u);
    EXPECT_FALSE(script.empty());
    EXPECT_EQ(script.getText(), "나이가 35살입니다");
    EXPECT_EQ(script.getNormalized().size(), 9u);
    EXPECT_TRUE(ReferenceScript("  ").empty());
}

TEST_F(AlignmentEngineTest, DefaultStrategyIsSequential) {
    EXPECT_EQ(engine.getStrategy().getName(), "sequential");
}

TEST_F(AlignmentEngineTest, LevenshteinStrategyAgreesOnCleanInput) {
    AlignmentEngine optimal(createAlignmentStrategy("levenshtein"));
    ReferenceScript script("오늘 날씨가 매우 좋습니다");
    
    auto partial = optimal.score(script, "오늘 날씨가");
    EXPECT_EQ(typesOf(partial), (std::vector<AlignType>{HIT, HIT, PENDING, PENDING}));
    
    auto skipped = optimal.score(script, "오늘 매우 좋습니다");
    EXPECT_EQ(typesOf(skipped), (std::vector<AlignType>{HIT, DEL, HIT, HIT}));
}
