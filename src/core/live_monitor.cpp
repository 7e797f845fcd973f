#include "core/live_monitor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_utils.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <utility>

namespace sttmon {
namespace core {

LiveMonitor::LiveMonitor(std::shared_ptr<HypothesisLog> log,
                         std::shared_ptr<MonitorView> view,
                         std::shared_ptr<const align::AlignmentStrategy> strategy,
                         double threshold,
                         int updateIntervalMs)
    : log_(log ? std::move(log) : std::make_shared<HypothesisLog>())
    , view_(std::move(view))
    , engine_(std::move(strategy))
    , threshold_(threshold)
    , updateIntervalMs_(updateIntervalMs > 0 ? updateIntervalMs : 500) {
}

LiveMonitor::~LiveMonitor() {
    stop();
}

void LiveMonitor::loadReference(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::ReferenceLoadException("Cannot open reference file", path);
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw utils::ReferenceLoadException("Failed to read reference file", path);
    }
    
    setReference(buffer.str());
    utils::Logger::info("Reference loaded from " + path + " (" +
                        std::to_string(getReferenceLength()) + " chars)");
}

void LiveMonitor::setReference(const std::string& text) {
    auto script = std::make_shared<const align::ReferenceScript>(utils::collapseWhitespace(text));
    {
        std::lock_guard<std::mutex> lock(referenceMutex_);
        reference_ = std::move(script);
        log_->clear();
        completed_ = false;
        ++epoch_;
    }
    
    if (view_) {
        view_->clear();
        view_->renderStatus("Reference loaded (" + std::to_string(getReferenceLength()) +
                            " chars) - waiting");
    }
}

void LiveMonitor::reset() {
    {
        std::lock_guard<std::mutex> lock(referenceMutex_);
        log_->clear();
        completed_ = false;
        ++epoch_;
    }
    
    if (view_) {
        view_->clear();
        view_->renderStatus(hasReference()
            ? "Reference loaded (" + std::to_string(getReferenceLength()) + " chars) - reset"
            : std::string("Monitoring (no reference)"));
    }
}

bool LiveMonitor::hasReference() const {
    std::lock_guard<std::mutex> lock(referenceMutex_);
    return reference_ && !reference_->getText().empty();
}

size_t LiveMonitor::getReferenceLength() const {
    std::lock_guard<std::mutex> lock(referenceMutex_);
    return reference_ ? utils::decodeUtf8(reference_->getText()).size() : 0;
}

std::optional<align::AlignmentReport> LiveMonitor::tick() {
    if (completed_.load() || log_->empty()) {
        return std::nullopt;
    }
    
    std::shared_ptr<const align::ReferenceScript> reference;
    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(referenceMutex_);
        reference = reference_;
        epoch = epoch_;
    }
    
    const std::string hypothesis = log_->snapshot();
    
    if (!reference || reference->getText().empty()) {
        align::AlignmentReport report;
        report.tokens.emplace_back(hypothesis, align::AlignType::HIT);
        if (view_) {
            view_->renderTokens(report.tokens);
        }
        return report;
    }
    
    align::AlignmentReport report = engine_.score(*reference, hypothesis, threshold_);
    
    {
        // A reset or a new script arrived while scoring; the result is stale
        std::lock_guard<std::mutex> lock(referenceMutex_);
        if (epoch != epoch_) {
            return std::nullopt;
        }
        if (report.isComplete()) {
            completed_ = true;
        }
    }
    if (report.isComplete()) {
        utils::Logger::info("Subtitle comparison complete");
    }
    
    if (view_) {
        view_->renderTokens(report.tokens);
        view_->renderMetrics(report.metrics);
        if (report.isComplete()) {
            view_->renderStatus("Subtitle comparison complete");
        }
    }
    return report;
}

void LiveMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    timerThread_ = std::thread(&LiveMonitor::timerLoop, this);
    utils::Logger::debug("Update timer started (" + std::to_string(updateIntervalMs_) + " ms)");
}

void LiveMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    timerCv_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }
}

void LiveMonitor::timerLoop() {
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (running_.load()) {
        timerCv_.wait_for(lock, std::chrono::milliseconds(updateIntervalMs_),
                          [this] { return !running_.load(); });
        if (!running_.load()) {
            break;
        }
        
        lock.unlock();
        try {
            tick();
        } catch (const std::exception& e) {
            HANDLE_ERROR(utils::ErrorCategory::ALIGNMENT, utils::ErrorSeverity::WARNING,
                         "Update cycle failed", e.what());
        }
        lock.lock();
    }
}

} // namespace core
} // namespace sttmon
