#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <poll.h>
#include <unistd.h>
#include "align/alignment_engine.hpp"
#include "core/console_renderer.hpp"
#include "core/hypothesis_log.hpp"
#include "core/live_monitor.hpp"
#include "core/monitor_server.hpp"
#include "core/subtitle_client.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_utils.hpp"

using namespace sttmon;

namespace {

std::atomic<bool> g_shutdownRequested{false};

void handleSignal(int) {
    g_shutdownRequested = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>      Configuration file (default: config/monitor.json)\n"
              << "  --reference <file>   Reference script to compare against\n"
              << "  --port <port>        Monitor server port (default: 26072)\n"
              << "  --threshold <x>      Token similarity threshold in [0,1] (default: 0.6)\n"
              << "  --no-color           Disable ANSI colors\n"
              << "  --score <file>       Score a hypothesis file against --reference and exit\n"
              << "  --help, -h           Show this help message\n"
              << "\n"
              << "Commands (stdin): load <file>, reset, reconnect, status, quit\n";
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::ReferenceLoadException("Cannot open file", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int runScore(const utils::Config& config, const std::string& referencePath,
             const std::string& hypothesisPath, bool useColor) {
    if (referencePath.empty()) {
        std::cerr << "--score requires --reference" << std::endl;
        return 1;
    }
    
    auto strategy = align::createAlignmentStrategy(config.getAlignStrategy(), config.getMaxLookahead());
    align::AlignmentEngine engine(strategy);
    align::ReferenceScript reference(utils::collapseWhitespace(readTextFile(referencePath)));
    
    align::AlignmentReport report = engine.score(reference, readTextFile(hypothesisPath),
                                                 config.getSimilarityThreshold());
    
    core::ConsoleRenderer renderer(std::cout, useColor);
    renderer.renderTokens(report.tokens);
    renderer.renderMetrics(report.metrics);
    renderer.renderStatus(report.isComplete() ? "complete" : "partial (" +
                          std::to_string(report.countOf(align::AlignType::PENDING)) +
                          " tokens pending)");
    return 0;
}

struct MonitorContext {
    utils::Config config;
    std::shared_ptr<core::HypothesisLog> log;
    std::shared_ptr<core::SubtitleClient> subtitleClient;
    std::unique_ptr<core::MonitorServer> server;
    std::unique_ptr<core::LiveMonitor> monitor;
    std::shared_ptr<core::ConsoleRenderer> renderer;
};

void connectSubtitleServer(MonitorContext& ctx) {
    const std::string peer = ctx.config.getSubtitleHost() + ":" +
                             std::to_string(ctx.config.getSubtitlePort());
    if (ctx.subtitleClient->connect()) {
        ctx.renderer->renderStatus("Subtitle server connected (" + peer + ")");
    } else {
        ctx.renderer->renderStatus("Subtitle server connection failed (" + peer + ")");
    }
}

void printStatus(const MonitorContext& ctx) {
    std::ostringstream ss;
    ss << "server " << (ctx.server->isRunning() ? "running" : "stopped")
       << " on " << ctx.config.getHost() << ":" << ctx.server->getPort()
       << ", reference " << (ctx.monitor->hasReference()
                             ? std::to_string(ctx.monitor->getReferenceLength()) + " chars"
                             : std::string("none"))
       << ", fragments " << ctx.log->size()
       << ", " << (ctx.monitor->isCompleted() ? "completed" : "in progress");
    if (ctx.subtitleClient) {
        ss << ", subtitle " << (ctx.subtitleClient->isConnected() ? "connected" : "disconnected");
    } else {
        ss << ", subtitle output disabled";
    }
    ss << ", errors " << utils::ErrorHandler::getInstance().getErrorCount();
    ctx.renderer->renderStatus(ss.str());
}

// Returns false when the command asks to quit
bool handleCommand(MonitorContext& ctx, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;
    
    if (command.empty()) {
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "load") {
        std::string path;
        std::getline(in, path);
        path = utils::trim(path);
        if (path.empty()) {
            ctx.renderer->renderStatus("usage: load <file>");
            return true;
        }
        try {
            ctx.monitor->loadReference(path);
        } catch (const utils::ReferenceLoadException& e) {
            HANDLE_EXCEPTION(e, "load command");
            ctx.renderer->renderStatus(std::string("Failed to load reference: ") + e.what());
        }
    } else if (command == "reset") {
        ctx.monitor->reset();
    } else if (command == "reconnect") {
        if (!ctx.subtitleClient) {
            ctx.renderer->renderStatus("Subtitle output disabled");
        } else {
            ctx.subtitleClient->disconnect();
            connectSubtitleServer(ctx);
        }
    } else if (command == "status") {
        printStatus(ctx);
    } else {
        ctx.renderer->renderStatus("Unknown command: " + command);
    }
    return true;
}

void runCommandLoop(MonitorContext& ctx) {
    bool stdinOpen = true;
    std::string pending;
    
    while (!g_shutdownRequested.load()) {
        if (!stdinOpen) {
            ::poll(nullptr, 0, 200);
            continue;
        }
        
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }
        
        char buffer[512];
        ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n <= 0) {
            stdinOpen = false;
            continue;
        }
        pending.append(buffer, static_cast<size_t>(n));
        
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!handleCommand(ctx, utils::trim(line))) {
                return;
            }
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Initialize logging
        utils::Logger::initialize();
        
        std::string configPath = "config/monitor.json";
        std::string referencePath;
        std::string scorePath;
        bool useColor = true;
        std::map<std::string, std::string> overrides;
        
        // Parse command line arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--reference" && i + 1 < argc) {
                referencePath = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                overrides["PORT"] = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                overrides["SIMILARITY_THRESHOLD"] = argv[++i];
            } else if (arg == "--score" && i + 1 < argc) {
                scorePath = argv[++i];
            } else if (arg == "--no-color") {
                useColor = false;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
        
        // Load configuration: file, then environment, then command line
        MonitorContext ctx;
        ctx.config = utils::Config::load(configPath);
        ctx.config.applyEnvironment();
        ctx.config.applyOverrides(overrides);
        
        utils::Logger::setLevel(utils::Logger::parseLevel(ctx.config.getLogLevel()));
        
        auto validation = ctx.config.validate();
        for (const auto& warning : validation.warnings) {
            utils::Logger::warn("Config: " + warning);
        }
        if (!validation.isValid) {
            for (const auto& error : validation.errors) {
                utils::Logger::error("Config: " + error);
            }
            return 1;
        }
        
        if (!scorePath.empty()) {
            return runScore(ctx.config, referencePath, scorePath, useColor);
        }
        
        ctx.renderer = std::make_shared<core::ConsoleRenderer>(std::cout, useColor);
        ctx.log = std::make_shared<core::HypothesisLog>();
        
        if (ctx.config.isSubtitleForwardingEnabled()) {
            ctx.subtitleClient = std::make_shared<core::SubtitleClient>(
                ctx.config.getSubtitleHost(), ctx.config.getSubtitlePort(),
                ctx.config.getSubtitleCheckcode());
            connectSubtitleServer(ctx);
        } else {
            ctx.renderer->renderStatus("Subtitle server output disabled");
        }
        
        auto strategy = align::createAlignmentStrategy(ctx.config.getAlignStrategy(),
                                                       ctx.config.getMaxLookahead());
        ctx.monitor = std::make_unique<core::LiveMonitor>(
            ctx.log, ctx.renderer, strategy,
            ctx.config.getSimilarityThreshold(), ctx.config.getUpdateIntervalMs());
        
        if (!referencePath.empty()) {
            ctx.monitor->loadReference(referencePath);
        }
        
        ctx.server = std::make_unique<core::MonitorServer>(ctx.config, ctx.log, ctx.subtitleClient);
        
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        
        ctx.server->start();
        ctx.monitor->start();
        
        ctx.renderer->renderStatus("Monitoring" +
            std::string(ctx.monitor->hasReference() ? "" : " (no reference)") + " on " +
            ctx.config.getHost() + ":" + std::to_string(ctx.server->getPort()));
        std::cout << "Press Ctrl+C or type 'quit' to stop the monitor" << std::endl;
        
        runCommandLoop(ctx);
        
        // Cleanup
        std::cout << "Shutting down..." << std::endl;
        ctx.monitor->stop();
        ctx.server->stop();
        if (ctx.subtitleClient) {
            ctx.subtitleClient->disconnect();
        }
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
