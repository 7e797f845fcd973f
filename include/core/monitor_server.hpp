#pragma once

#include "core/frame_server.hpp"
#include "core/hypothesis_log.hpp"
#include "core/subtitle_client.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace sttmon {
namespace utils {
class Config;
}

namespace core {

/**
 * Intake side of the monitor. Accepts recognized fragments from the STT
 * feed as JSON frames ({"text": "..."}), appends them to the hypothesis log
 * and optionally forwards the untouched payload to the subtitle server.
 *
 * Every frame is answered with status 0, including frames whose payload is
 * not valid JSON.
 */
class MonitorServer {
public:
    MonitorServer(const std::string& host, int port, int32_t responseCheckcode,
                  std::shared_ptr<HypothesisLog> log,
                  std::shared_ptr<SubtitleSender> forwarder = nullptr);
    MonitorServer(const utils::Config& config, std::shared_ptr<HypothesisLog> log,
                  std::shared_ptr<SubtitleSender> forwarder = nullptr);
    
    void start();
    void stop();
    bool isRunning() const { return server_.isRunning(); }
    int getPort() const { return server_.getPort(); }
    
    uint8_t handleFrame(int32_t checkcode, int32_t requestCode, const std::string& payload);
    
    size_t getFramesReceived() const { return framesReceived_.load(); }
    size_t getForwardFailures() const { return forwardFailures_.load(); }

private:
    void forward(const std::string& payload);
    
    std::shared_ptr<HypothesisLog> log_;
    std::shared_ptr<SubtitleSender> forwarder_;
    std::atomic<size_t> framesReceived_{0};
    std::atomic<size_t> forwardFailures_{0};
    FrameServer server_;
};

} // namespace core
} // namespace sttmon
