#include "core/console_renderer.hpp"
#include <iomanip>
#include <sstream>

namespace sttmon {
namespace core {

namespace {
const char* const kColorReset = "\033[0m";
}

ConsoleRenderer::ConsoleRenderer(std::ostream& out, bool useColor)
    : out_(out), useColor_(useColor) {
}

const char* ConsoleRenderer::colorFor(align::AlignType type) {
    switch (type) {
        case align::AlignType::HIT: return "\033[32m";
        case align::AlignType::SUB: return "\033[31m";
        case align::AlignType::DEL: return "\033[33m";
        case align::AlignType::INS: return "\033[38;5;208m";
        case align::AlignType::PENDING: return "";
        default: return "";
    }
}

std::string ConsoleRenderer::formatTokens(const std::vector<align::AlignedToken>& tokens, bool useColor) {
    std::string line;
    for (const auto& token : tokens) {
        if (token.type == align::AlignType::PENDING) {
            continue;
        }
        
        std::string text = token.type == align::AlignType::INS
            ? "[" + token.text + "]"
            : token.text;
        
        if (!line.empty()) {
            line += ' ';
        }
        if (useColor) {
            line += colorFor(token.type);
            line += text;
            line += kColorReset;
        } else {
            line += text;
        }
    }
    return line;
}

std::string ConsoleRenderer::formatMetrics(const align::PartialMetrics& metrics) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << "Current WER: " << metrics.wer * 100.0 << "%"
       << "  Global CER: " << metrics.cer * 100.0 << "%"
       << "  (hit " << metrics.hits
       << ", sub " << metrics.substitutions
       << ", del " << metrics.deletions
       << ", ins " << metrics.insertions
       << " / " << metrics.refProcessed << ")";
    return ss.str();
}

void ConsoleRenderer::renderTokens(const std::vector<align::AlignedToken>& tokens) {
    std::string line = formatTokens(tokens, useColor_);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

void ConsoleRenderer::renderMetrics(const align::PartialMetrics& metrics) {
    std::string line = formatMetrics(metrics);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

void ConsoleRenderer::renderStatus(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[STATUS] " << status << std::endl;
}

void ConsoleRenderer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (useColor_) {
        out_ << "\033[2J\033[H" << std::flush;
    } else {
        out_ << std::endl;
    }
}

} // namespace core
} // namespace sttmon
