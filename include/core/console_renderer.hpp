#pragma once

#include "align/metrics_calculator.hpp"
#include "align/token_classifier.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace sttmon {
namespace core {

/**
 * Presentation seam of the live monitor
 */
class MonitorView {
public:
    virtual ~MonitorView() = default;
    virtual void renderTokens(const std::vector<align::AlignedToken>& tokens) = 0;
    virtual void renderMetrics(const align::PartialMetrics& metrics) = 0;
    virtual void renderStatus(const std::string& status) = 0;
    virtual void clear() = 0;
};

/**
 * Terminal view. Hit is green, Sub red, Del yellow and Ins orange (shown in
 * brackets); Pending tokens are not printed.
 */
class ConsoleRenderer : public MonitorView {
public:
    explicit ConsoleRenderer(std::ostream& out = std::cout, bool useColor = true);
    
    void renderTokens(const std::vector<align::AlignedToken>& tokens) override;
    void renderMetrics(const align::PartialMetrics& metrics) override;
    void renderStatus(const std::string& status) override;
    void clear() override;
    
    void setUseColor(bool useColor) { useColor_ = useColor; }
    bool getUseColor() const { return useColor_; }
    
    static std::string formatTokens(const std::vector<align::AlignedToken>& tokens, bool useColor);
    // "Current WER: 12.50%  Global CER: 3.10%  (hit 7, sub 1, del 0, ins 0 / 8)"
    static std::string formatMetrics(const align::PartialMetrics& metrics);
    static const char* colorFor(align::AlignType type);

private:
    std::ostream& out_;
    bool useColor_;
    std::mutex mutex_;
};

} // namespace core
} // namespace sttmon
