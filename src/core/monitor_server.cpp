#include "core/monitor_server.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_utils.hpp"
#include <utility>

namespace sttmon {
namespace core {

MonitorServer::MonitorServer(const std::string& host, int port, int32_t responseCheckcode,
                             std::shared_ptr<HypothesisLog> log,
                             std::shared_ptr<SubtitleSender> forwarder)
    : log_(std::move(log))
    , forwarder_(std::move(forwarder))
    , server_("Monitor server", host, port, responseCheckcode,
              [this](int32_t checkcode, int32_t requestCode, const std::string& payload) {
                  return handleFrame(checkcode, requestCode, payload);
              }) {
    if (!log_) {
        log_ = std::make_shared<HypothesisLog>();
    }
}

MonitorServer::MonitorServer(const utils::Config& config, std::shared_ptr<HypothesisLog> log,
                             std::shared_ptr<SubtitleSender> forwarder)
    : MonitorServer(config.getHost(), config.getPort(), config.getResponseCheckcode(),
                    std::move(log), std::move(forwarder)) {
}

void MonitorServer::start() {
    server_.start();
}

void MonitorServer::stop() {
    server_.stop();
}

uint8_t MonitorServer::handleFrame(int32_t checkcode, int32_t requestCode, const std::string& payload) {
    ++framesReceived_;
    
    if (requestCode != kRequestSubtitle) {
        utils::Logger::debug("Unexpected request code " + std::to_string(requestCode) +
                             " (checkcode " + std::to_string(checkcode) + ")");
    }
    
    std::string token;
    try {
        utils::JsonValue root = utils::JsonParser::parse(payload);
        token = utils::trim(root.getString("text"));
    } catch (const std::exception& e) {
        utils::Logger::debug(std::string("Ignoring non-JSON payload: ") + e.what());
        return kStatusOk;
    }
    
    if (token.empty()) {
        return kStatusOk;
    }
    
    utils::Logger::info("[Received] " + token);
    log_->append(token);
    
    if (forwarder_) {
        forward(payload);
    }
    return kStatusOk;
}

void MonitorServer::forward(const std::string& payload) {
    if (!forwarder_->sendSubtitle(payload)) {
        ++forwardFailures_;
        utils::Logger::warn("Subtitle server unreachable, fragment not forwarded");
    }
}

} // namespace core
} // namespace sttmon
