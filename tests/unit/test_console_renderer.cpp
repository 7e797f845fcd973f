#include <gtest/gtest.h>
#include "core/console_renderer.hpp"
#include <sstream>

using namespace sttmon::core;
using sttmon::align::AlignedToken;
using sttmon::align::AlignType;
using sttmon::align::PartialMetrics;

class ConsoleRendererTest : public ::testing::Test {
protected:
    std::vector<AlignedToken> tokens = {
        {"오늘", AlignType::HIT},
        {"날씨가", AlignType::SUB},
        {"매우", AlignType::DEL},
        {"정말", AlignType::INS},
        {"좋습니다", AlignType::PENDING}
    };
};

TEST_F(ConsoleRendererTest, PlainTokensSkipPendingAndBracketInsertions) {
    EXPECT_EQ(ConsoleRenderer::formatTokens(tokens, false), "오늘 날씨가 매우 [정말]");
}

TEST_F(ConsoleRendererTest, ColoredTokens) {
    std::string line = ConsoleRenderer::formatTokens(tokens, true);
    
    EXPECT_NE(line.find("\033[32m오늘\033[0m"), std::string::npos);
    EXPECT_NE(line.find("\033[31m날씨가\033[0m"), std::string::npos);
    EXPECT_NE(line.find("\033[33m매우\033[0m"), std::string::npos);
    EXPECT_NE(line.find("\033[38;5;208m[정말]\033[0m"), std::string::npos);
    EXPECT_EQ(line.find("좋습니다"), std::string::npos);
}

TEST_F(ConsoleRendererTest, MetricsLine) {
    PartialMetrics metrics;
    metrics.wer = 0.125;
    metrics.cer = 1.0 / 30.0;
    metrics.hits = 7;
    metrics.substitutions = 1;
    metrics.refProcessed = 8;
    
    EXPECT_EQ(ConsoleRenderer::formatMetrics(metrics),
              "Current WER: 12.50%  Global CER: 3.33%  (hit 7, sub 1, del 0, ins 0 / 8)");
}

TEST_F(ConsoleRendererTest, WritesToStream) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, false);
    
    renderer.renderTokens(tokens);
    renderer.renderMetrics(PartialMetrics());
    renderer.renderStatus("ready");
    
    EXPECT_EQ(out.str(),
              "오늘 날씨가 매우 [정말]\n"
              "Current WER: 0.00%  Global CER: 0.00%  (hit 0, sub 0, del 0, ins 0 / 0)\n"
              "[STATUS] ready\n");
}

TEST_F(ConsoleRendererTest, ColorToggle) {
    std::ostringstream out;
    ConsoleRenderer renderer(out);
    EXPECT_TRUE(renderer.getUseColor());
    renderer.setUseColor(false);
    renderer.renderTokens({{"가방", AlignType::HIT}});
    EXPECT_EQ(out.str(), "가방\n");
}
