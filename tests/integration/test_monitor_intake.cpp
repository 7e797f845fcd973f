#include <gtest/gtest.h>
#include "core/monitor_server.hpp"
#include "fixtures/frame_test_client.hpp"
#include "utils/config.hpp"

using namespace sttmon::core;
using sttmon::test::FrameTestClient;

class MonitorIntakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = std::make_shared<HypothesisLog>();
        server = std::make_unique<MonitorServer>("127.0.0.1", 0, kSubtitleResponseCheckcode, log);
        server->start();
        ASSERT_TRUE(server->isRunning());
        ASSERT_GT(server->getPort(), 0);
    }
    
    void TearDown() override {
        server->stop();
    }
    
    std::shared_ptr<HypothesisLog> log;
    std::unique_ptr<MonitorServer> server;
};

TEST_F(MonitorIntakeTest, AcknowledgesAndRecordsFragments) {
    FrameTestClient client(server->getPort());
    
    FrameResponse first = client.send(0x11, kRequestSubtitle, R"({"text": " 오늘 날씨가 "})");
    EXPECT_EQ(first.checkcode, kSubtitleResponseCheckcode);
    EXPECT_EQ(first.requestCode, kRequestSubtitle);
    EXPECT_EQ(first.status, kStatusOk);
    
    client.send(0x11, kRequestSubtitle, R"({"text": "매우 좋습니다"})");
    
    EXPECT_EQ(log->snapshot(), "오늘 날씨가 매우 좋습니다");
    EXPECT_EQ(server->getFramesReceived(), 2u);
}

TEST_F(MonitorIntakeTest, InvalidPayloadStillAcknowledged) {
    FrameTestClient client(server->getPort());
    
    EXPECT_EQ(client.send(1, kRequestSubtitle, "plain text").status, kStatusOk);
    EXPECT_EQ(client.send(1, kRequestSubtitle, R"({"text": "   "})").status, kStatusOk);
    EXPECT_EQ(client.send(1, kRequestSubtitle, "").status, kStatusOk);
    
    EXPECT_TRUE(log->empty());
}

TEST_F(MonitorIntakeTest, EchoesRequestCode) {
    FrameTestClient client(server->getPort());
    
    FrameResponse response = client.send(1, 42, R"({"text": "가"})");
    EXPECT_EQ(response.requestCode, 42);
    EXPECT_EQ(log->snapshot(), "가");
}

TEST_F(MonitorIntakeTest, FrameSplitAcrossWrites) {
    FrameTestClient client(server->getPort());
    std::vector<uint8_t> frame = FrameCodec::encodeRequest(1, kRequestSubtitle, R"({"text": "나눠서"})");
    
    std::vector<uint8_t> head(frame.begin(), frame.begin() + 5);
    std::vector<uint8_t> tail(frame.begin() + 5, frame.end());
    client.sendRaw(head);
    client.sendRaw(tail);
    
    EXPECT_EQ(client.readResponse().status, kStatusOk);
    EXPECT_EQ(log->snapshot(), "나눠서");
}

TEST_F(MonitorIntakeTest, OversizedFrameDropsOnlyThatClient) {
    FrameTestClient bad(server->getPort());
    std::vector<uint8_t> header;
    FrameCodec::writeInt32(header, 1);
    FrameCodec::writeInt32(header, kRequestSubtitle);
    FrameCodec::writeInt32(header, kMaxPayloadSize + 1);
    bad.sendRaw(header);
    
    EXPECT_TRUE(bad.peerClosed());
    EXPECT_TRUE(server->isRunning());
    
    FrameTestClient good(server->getPort());
    EXPECT_EQ(good.send(1, kRequestSubtitle, R"({"text": "계속"})").status, kStatusOk);
    EXPECT_EQ(log->snapshot(), "계속");
}

TEST_F(MonitorIntakeTest, SeveralClientsShareTheLog) {
    FrameTestClient first(server->getPort());
    FrameTestClient second(server->getPort());
    
    first.send(1, kRequestSubtitle, R"({"text": "하나"})");
    second.send(2, kRequestSubtitle, R"({"text": "둘"})");
    
    EXPECT_EQ(log->snapshot(), "하나 둘");
}

TEST_F(MonitorIntakeTest, StopClosesConnectedClients) {
    FrameTestClient client(server->getPort());
    client.send(1, kRequestSubtitle, R"({"text": "끝"})");
    
    server->stop();
    
    EXPECT_FALSE(server->isRunning());
    EXPECT_TRUE(client.peerClosed());
}

TEST(MonitorServerConfigTest, UsesConfiguredResponseCheckcode) {
    sttmon::utils::Config config;
    config.applyOverrides({{"HOST", "127.0.0.1"}, {"PORT", "0"}, {"RESP_CHECKCODE", "777"}});
    
    MonitorServer server(config, nullptr);
    server.start();
    
    FrameTestClient client(server.getPort());
    EXPECT_EQ(client.send(1, kRequestSubtitle, R"({"text": "x"})").checkcode, 777);
    server.stop();
}
