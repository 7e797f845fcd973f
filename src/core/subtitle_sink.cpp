#include "core/subtitle_sink.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_utils.hpp"
#include <fstream>
#include <utility>

namespace sttmon {
namespace core {

namespace {
bool isSentenceEnd(char c) {
    return c == '?' || c == '!' || c == '.';
}
}

std::string formatSubtitleText(const std::string& text) {
    const std::string trimmed = utils::trim(text);
    std::string out;
    
    std::string chunk;
    for (char c : trimmed) {
        if (isSentenceEnd(c)) {
            out += chunk;
            out += c;
            out += '\n';
            chunk.clear();
        } else {
            chunk += c;
        }
    }
    if (!chunk.empty()) {
        out += chunk;
        out += ' ';
    }
    return out;
}

SubtitleSink::SubtitleSink(const std::string& host, int port, int32_t responseCheckcode,
                           std::string outputPath)
    : outputPath_(std::move(outputPath))
    , server_("Subtitle sink", host, port, responseCheckcode,
              [this](int32_t checkcode, int32_t requestCode, const std::string& payload) {
                  return handleFrame(checkcode, requestCode, payload);
              }) {
}

void SubtitleSink::start() {
    server_.start();
    utils::Logger::info("Subtitle sink writing to " + outputPath_);
}

void SubtitleSink::stop() {
    server_.stop();
}

uint8_t SubtitleSink::handleFrame(int32_t /*checkcode*/, int32_t /*requestCode*/,
                                  const std::string& payload) {
    ++framesReceived_;
    utils::Logger::info("[TEXT] " + payload);
    
    try {
        utils::JsonValue root = utils::JsonParser::parse(payload);
        appendText(root.getString("text"));
    } catch (const utils::SttMonException& e) {
        HANDLE_EXCEPTION(e, "Subtitle sink");
    } catch (const std::exception& e) {
        utils::Logger::warn(std::string("failed to parse JSON: ") + e.what());
    }
    return kStatusOk;
}

void SubtitleSink::appendText(const std::string& text) {
    const std::string formatted = formatSubtitleText(text);
    if (formatted.empty()) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(fileMutex_);
    std::ofstream file(outputPath_, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        throw utils::SttMonException(utils::ErrorInfo(
            utils::ErrorCategory::SYSTEM, utils::ErrorSeverity::ERROR,
            "Cannot open subtitle output file", outputPath_));
    }
    file << formatted;
}

} // namespace core
} // namespace sttmon
