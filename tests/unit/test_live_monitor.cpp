#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/live_monitor.hpp"
#include "align/sequential_aligner.hpp"
#include "utils/error_handler.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <thread>

using namespace sttmon::core;
using namespace sttmon::align;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class MockMonitorView : public MonitorView {
public:
    MOCK_METHOD(void, renderTokens, (const std::vector<AlignedToken>& tokens), (override));
    MOCK_METHOD(void, renderMetrics, (const PartialMetrics& metrics), (override));
    MOCK_METHOD(void, renderStatus, (const std::string& status), (override));
    MOCK_METHOD(void, clear, (), (override));
};

// Resets the monitor once from inside align(), as the command thread can
// while the timer thread is scoring
class ResetDuringAlignStrategy : public AlignmentStrategy {
public:
    CharacterAlignment align(const std::u32string& reference,
                             const std::u32string& hypothesis) const override {
        if (monitor && !fired) {
            fired = true;
            monitor->reset();
        }
        return SequentialAligner().align(reference, hypothesis);
    }
    std::string getName() const override { return "reset-during-align"; }
    
    LiveMonitor* monitor = nullptr;
    mutable bool fired = false;
};

class LiveMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = std::make_shared<HypothesisLog>();
        view = std::make_shared<NiceMock<MockMonitorView>>();
        monitor = std::make_unique<LiveMonitor>(log, view);
    }
    
    std::shared_ptr<HypothesisLog> log;
    std::shared_ptr<NiceMock<MockMonitorView>> view;
    std::unique_ptr<LiveMonitor> monitor;
};

TEST_F(LiveMonitorTest, NothingReceivedYet) {
    monitor->setReference("오늘 날씨가 좋습니다");
    EXPECT_CALL(*view, renderTokens(_)).Times(0);
    
    EXPECT_FALSE(monitor->tick().has_value());
}

TEST_F(LiveMonitorTest, WithoutReferenceEchoesHypothesis) {
    log->append("아무 말");
    log->append("입니다");
    
    EXPECT_CALL(*view, renderTokens(_)).Times(1);
    auto report = monitor->tick();
    
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->tokens.size(), 1u);
    EXPECT_EQ(report->tokens[0].text, "아무 말 입니다");
    EXPECT_EQ(report->tokens[0].type, AlignType::HIT);
    EXPECT_EQ(report->metrics.refProcessed, 0u);
    EXPECT_FALSE(monitor->isCompleted());
}

TEST_F(LiveMonitorTest, SetReferenceCollapsesWhitespaceAndClearsLog) {
    log->append("이전 발화");
    
    EXPECT_CALL(*view, clear()).Times(1);
    EXPECT_CALL(*view, renderStatus(HasSubstr("Reference loaded"))).Times(1);
    monitor->setReference("  가나\n\n다라  ");
    
    EXPECT_TRUE(log->empty());
    EXPECT_TRUE(monitor->hasReference());
    EXPECT_EQ(monitor->getReferenceLength(), 5u);
}

TEST_F(LiveMonitorTest, PartialProgress) {
    monitor->setReference("오늘 날씨가 매우 좋습니다");
    log->append("오늘 날씨가");
    
    EXPECT_CALL(*view, renderTokens(_)).Times(1);
    EXPECT_CALL(*view, renderMetrics(_)).Times(1);
    auto report = monitor->tick();
    
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->metrics.refProcessed, 2u);
    EXPECT_FALSE(monitor->isCompleted());
}

TEST_F(LiveMonitorTest, CompletionStopsRescoring) {
    monitor->setReference("안녕하세요? 반갑습니다!");
    log->append("안녕하세요");
    log->append("반갑습니다");
    
    EXPECT_CALL(*view, renderStatus(_)).Times(AnyNumber());
    EXPECT_CALL(*view, renderStatus(HasSubstr("complete"))).Times(1);
    
    auto first = monitor->tick();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->isComplete());
    EXPECT_TRUE(monitor->isCompleted());
    
    log->append("추가 발화");
    EXPECT_FALSE(monitor->tick().has_value());
}

TEST_F(LiveMonitorTest, ResetKeepsReference) {
    monitor->setReference("안녕하세요");
    log->append("안녕하세요");
    ASSERT_TRUE(monitor->tick().has_value());
    ASSERT_TRUE(monitor->isCompleted());
    
    monitor->reset();
    
    EXPECT_FALSE(monitor->isCompleted());
    EXPECT_TRUE(log->empty());
    EXPECT_TRUE(monitor->hasReference());
    
    log->append("안녕");
    EXPECT_TRUE(monitor->tick().has_value());
}

TEST_F(LiveMonitorTest, LoadReferenceFromFile) {
    const std::string path = ::testing::TempDir() + "sttmon_reference.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "오늘 날씨가\n좋습니다\n";
    }
    
    monitor->loadReference(path);
    
    EXPECT_TRUE(monitor->hasReference());
    EXPECT_EQ(monitor->getReferenceLength(), 11u);
    std::remove(path.c_str());
}

TEST_F(LiveMonitorTest, MissingReferenceFileThrows) {
    EXPECT_THROW(monitor->loadReference("/nonexistent/sttmon/script.txt"),
                 sttmon::utils::ReferenceLoadException);
    EXPECT_FALSE(monitor->hasReference());
}

TEST_F(LiveMonitorTest, TimerDrivesUpdates) {
    monitor = std::make_unique<LiveMonitor>(log, view, nullptr, kDefaultSimilarityThreshold, 20);
    monitor->setReference("오늘 날씨가 매우 좋습니다");
    log->append("오늘 날씨가 매우 좋습니다");
    
    EXPECT_CALL(*view, renderTokens(_)).Times(1);
    monitor->start();
    EXPECT_TRUE(monitor->isRunning());
    
    for (int i = 0; i < 100 && !monitor->isCompleted(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    monitor->stop();
    
    EXPECT_TRUE(monitor->isCompleted());
    EXPECT_FALSE(monitor->isRunning());
}

TEST_F(LiveMonitorTest, StopWithoutStartIsHarmless) {
    monitor->stop();
    EXPECT_FALSE(monitor->isRunning());
}

TEST_F(LiveMonitorTest, ResetWhileScoringDiscardsStaleResult) {
    auto strategy = std::make_shared<ResetDuringAlignStrategy>();
    monitor = std::make_unique<LiveMonitor>(log, view, strategy);
    strategy->monitor = monitor.get();
    
    monitor->setReference("안녕하세요");
    log->append("안녕하세요");
    
    EXPECT_CALL(*view, renderTokens(_)).Times(1);
    EXPECT_FALSE(monitor->tick().has_value());
    EXPECT_TRUE(strategy->fired);
    EXPECT_FALSE(monitor->isCompleted());
    EXPECT_TRUE(log->empty());
    
    // The new session is scored normally
    log->append("안녕하세요");
    auto report = monitor->tick();
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->isComplete());
    EXPECT_TRUE(monitor->isCompleted());
}
