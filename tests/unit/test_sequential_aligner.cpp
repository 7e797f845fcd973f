#include <gtest/gtest.h>
#include "align/sequential_aligner.hpp"
#include "utils/error_handler.hpp"
#include <vector>

using namespace sttmon::align;

namespace {
const CharacterState H = CharacterState::HIT;
const CharacterState S = CharacterState::SUB;
const CharacterState D = CharacterState::DEL;
const CharacterState P = CharacterState::PENDING;
}

class SequentialAlignerTest : public ::testing::Test {
protected:
    SequentialAligner aligner;
};

TEST_F(SequentialAlignerTest, IdenticalStrings) {
    auto result = aligner.align(U"가방학교", U"가방학교");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, H, H, H}));
    EXPECT_EQ(result.lastProcessedIndex, 3);
}

TEST_F(SequentialAlignerTest, PrefixLeavesRestPending) {
    auto result = aligner.align(U"abcdef", U"abc");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, H, H, P, P, P}));
    EXPECT_EQ(result.lastProcessedIndex, 2);
}

TEST_F(SequentialAlignerTest, SkippedReferenceCharacterIsDeleted) {
    auto result = aligner.align(U"abcdef", U"abdef");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, H, D, H, H, H}));
    EXPECT_EQ(result.lastProcessedIndex, 5);
}

TEST_F(SequentialAlignerTest, ExtraHypothesisCharacterIsDropped) {
    auto result = aligner.align(U"abcd", U"abxcd");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, H, H, H}));
}

TEST_F(SequentialAlignerTest, MismatchIsSubstitution) {
    auto result = aligner.align(U"abcd", U"abxd");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, H, S, H}));
}

TEST_F(SequentialAlignerTest, LookaheadIsBounded) {
    auto result = aligner.align(U"abcdefg", U"ag");
    EXPECT_EQ(result.states, (std::vector<CharacterState>{H, S, P, P, P, P, P}));
    EXPECT_EQ(result.lastProcessedIndex, 1);
    
    SequentialAligner wide(6);
    auto resynced = wide.align(U"abcdefg", U"ag");
    EXPECT_EQ(resynced.states, (std::vector<CharacterState>{H, D, D, D, D, D, H}));
    EXPECT_EQ(resynced.lastProcessedIndex, 6);
}

TEST_F(SequentialAlignerTest, RepeatedPhraseIsNotMatchedEarly) {
    auto result = aligner.align(U"가나다라마바사가나다라", U"가나다라마바");
    EXPECT_EQ(result.lastProcessedIndex, 5);
    for (size_t i = 6; i < result.states.size(); ++i) {
        EXPECT_EQ(result.states[i], P) << "index " << i;
    }
}

TEST_F(SequentialAlignerTest, EmptyInputs) {
    auto noHypothesis = aligner.align(U"abc", U"");
    EXPECT_EQ(noHypothesis.states, (std::vector<CharacterState>{P, P, P}));
    EXPECT_EQ(noHypothesis.lastProcessedIndex, -1);
    
    auto noReference = aligner.align(U"", U"abc");
    EXPECT_TRUE(noReference.states.empty());
    EXPECT_EQ(noReference.lastProcessedIndex, -1);
}

TEST_F(SequentialAlignerTest, StateCountMatchesReference) {
    auto result = aligner.align(U"abcdefghij", U"xyzabq");
    EXPECT_EQ(result.states.size(), 10u);
}

TEST_F(SequentialAlignerTest, LastProcessedIndexGrowsWithPrefix) {
    const std::u32string reference = U"오늘날씨가매우좋습니다";
    int previous = -1;
    for (size_t length = 0; length <= reference.size(); ++length) {
        auto result = aligner.align(reference, reference.substr(0, length));
        EXPECT_GE(result.lastProcessedIndex, previous);
        EXPECT_EQ(result.lastProcessedIndex, static_cast<int>(length) - 1);
        previous = result.lastProcessedIndex;
    }
}

// Monotonic growth holds along a prefix of the reference only. Noise that
// the hypothesis lookahead later skips can pull the index back.
TEST_F(SequentialAlignerTest, LastProcessedIndexCanDropForNonPrefixHypothesis) {
    auto before = aligner.align(U"abc", U"xy");
    EXPECT_EQ(before.states, (std::vector<CharacterState>{S, S, P}));
    EXPECT_EQ(before.lastProcessedIndex, 1);
    
    auto after = aligner.align(U"abc", U"xya");
    EXPECT_EQ(after.states, (std::vector<CharacterState>{H, P, P}));
    EXPECT_EQ(after.lastProcessedIndex, 0);
}

TEST_F(SequentialAlignerTest, LookaheadClampedToOne) {
    SequentialAligner zero(0);
    EXPECT_EQ(zero.getMaxLookahead(), 1);
    EXPECT_EQ(aligner.getMaxLookahead(), kDefaultMaxLookahead);
    EXPECT_EQ(aligner.getName(), "sequential");
}

TEST(AlignmentStrategyFactoryTest, KnownNames) {
    EXPECT_EQ(createAlignmentStrategy("sequential")->getName(), "sequential");
    EXPECT_EQ(createAlignmentStrategy("")->getName(), "sequential");
    EXPECT_EQ(createAlignmentStrategy("levenshtein")->getName(), "levenshtein");
}

TEST(AlignmentStrategyFactoryTest, UnknownNameThrows) {
    EXPECT_THROW(createAlignmentStrategy("dtw"), sttmon::utils::ConfigurationException);
}

TEST(AlignmentStrategyFactoryTest, FindLastProcessedIndex) {
    EXPECT_EQ(findLastProcessedIndex({}), -1);
    EXPECT_EQ(findLastProcessedIndex({P, P}), -1);
    EXPECT_EQ(findLastProcessedIndex({H, D, P, S, P}), 3);
    EXPECT_STREQ(characterStateToString(D), "del");
}
