#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <string>
#include <poll.h>
#include "core/subtitle_sink.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"

using namespace sttmon;

namespace {

std::atomic<bool> g_shutdownRequested{false};

void handleSignal(int) {
    g_shutdownRequested = true;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();
        
        std::string configPath = "config/monitor.json";
        std::string host;
        std::map<std::string, std::string> overrides;
        
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--host" && i + 1 < argc) {
                host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                overrides["SUBTITLE_PORT"] = argv[++i];
            } else if (arg == "--out" && i + 1 < argc) {
                overrides["RAW_OUT_PATH"] = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --config <file>  Configuration file (default: config/monitor.json)\n"
                          << "  --host <addr>    Listen address (default: 0.0.0.0)\n"
                          << "  --port <port>    Listen port (default: SUBTITLE_PORT, 26071)\n"
                          << "  --out <file>     Output file (default: RAW_OUT_PATH)\n"
                          << "  --help, -h       Show this help message\n";
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
        }
        
        auto config = utils::Config::load(configPath);
        config.applyEnvironment();
        config.applyOverrides(overrides);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));
        
        core::SubtitleSink sink(host.empty() ? "0.0.0.0" : host,
                                config.getSubtitlePort(),
                                config.getResponseCheckcode(),
                                config.getRawOutPath());
        
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        
        sink.start();
        std::cout << "[CTRL+C] to stop server" << std::endl;
        
        while (!g_shutdownRequested.load()) {
            ::poll(nullptr, 0, 200);
        }
        
        std::cout << "\n[SERVER] Shutdown requested..." << std::endl;
        sink.stop();
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
