#pragma once

#include "align/alignment_engine.hpp"
#include "core/console_renderer.hpp"
#include "core/hypothesis_log.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sttmon {
namespace core {

/**
 * Periodically scores the accumulated hypothesis against the loaded script
 * and pushes the result to a view. Once every script token has been reached
 * the monitor is complete and stops rescoring until reset or a new script.
 */
class LiveMonitor {
public:
    LiveMonitor(std::shared_ptr<HypothesisLog> log,
                std::shared_ptr<MonitorView> view,
                std::shared_ptr<const align::AlignmentStrategy> strategy = nullptr,
                double threshold = align::kDefaultSimilarityThreshold,
                int updateIntervalMs = 500);
    ~LiveMonitor();
    
    LiveMonitor(const LiveMonitor&) = delete;
    LiveMonitor& operator=(const LiveMonitor&) = delete;
    
    // Reads a UTF-8 script; throws ReferenceLoadException
    void loadReference(const std::string& path);
    void setReference(const std::string& text);
    // Clears the hypothesis and the completion flag, keeps the script
    void reset();
    
    /**
     * One update cycle. Returns nullopt when completed or when nothing has
     * been received. Without a script the raw hypothesis comes back as a
     * single HIT token with zero metrics. A result overtaken by reset() or
     * setReference() while scoring is dropped and nullopt is returned.
     */
    std::optional<align::AlignmentReport> tick();
    
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }
    
    bool isCompleted() const { return completed_.load(); }
    bool hasReference() const;
    // Code point count of the whitespace-collapsed script
    size_t getReferenceLength() const;
    double getThreshold() const { return threshold_; }
    
private:
    void timerLoop();
    
    std::shared_ptr<HypothesisLog> log_;
    std::shared_ptr<MonitorView> view_;
    align::AlignmentEngine engine_;
    double threshold_;
    int updateIntervalMs_;
    
    mutable std::mutex referenceMutex_;
    std::shared_ptr<const align::ReferenceScript> reference_;
    std::atomic<bool> completed_{false};
    // Bumped by reset() and setReference(); guarded by referenceMutex_
    uint64_t epoch_ = 0;
    
    std::atomic<bool> running_{false};
    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    std::thread timerThread_;
};

} // namespace core
} // namespace sttmon
