#pragma once

#include "core/frame_server.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace sttmon {
namespace core {

/**
 * Line layout of the sink's output file: the text is split after every
 * '?', '!' or '.', a chunk ending in one of them is followed by a newline
 * and any other chunk by a space. Blank input gives an empty string.
 */
std::string formatSubtitleText(const std::string& text);

/**
 * Stand-in for the subtitle output server. Receives the forwarded JSON
 * frames and appends their "text" field to a plain text file.
 */
class SubtitleSink {
public:
    SubtitleSink(const std::string& host, int port, int32_t responseCheckcode,
                 std::string outputPath);
    
    void start();
    void stop();
    bool isRunning() const { return server_.isRunning(); }
    int getPort() const { return server_.getPort(); }
    const std::string& getOutputPath() const { return outputPath_; }
    
    uint8_t handleFrame(int32_t checkcode, int32_t requestCode, const std::string& payload);
    // Throws SttMonException (SYSTEM) when the file cannot be written
    void appendText(const std::string& text);
    
    size_t getFramesReceived() const { return framesReceived_.load(); }

private:
    std::string outputPath_;
    std::mutex fileMutex_;
    std::atomic<size_t> framesReceived_{0};
    FrameServer server_;
};

} // namespace core
} // namespace sttmon
