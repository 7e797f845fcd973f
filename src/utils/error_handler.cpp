#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>

namespace sttmon {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_peer_;

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
                     const std::string& det, const std::string& ctx, const std::string& peer_addr)
    : category(cat), severity(sev), message(msg), details(det), context(ctx), 
      timestamp(std::chrono::steady_clock::now()), peer(peer_addr) {
    
    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    
    std::lock_guard<std::mutex> lock(id_mutex);
    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

SttMonException::SttMonException(const ErrorInfo& error_info) 
    : error_info_(error_info) {
}

const char* SttMonException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

NetworkException::NetworkException(const std::string& message, const std::string& details,
                                   const std::string& peer)
    : SttMonException(ErrorInfo(ErrorCategory::NETWORK, ErrorSeverity::ERROR,
                                message, details, "Network", peer)) {
}

ProtocolException::ProtocolException(const std::string& message, const std::string& details)
    : SttMonException(ErrorInfo(ErrorCategory::PROTOCOL, ErrorSeverity::ERROR,
                                message, details, "FrameProtocol")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& key)
    : SttMonException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                message, key, "Configuration")) {
}

ReferenceLoadException::ReferenceLoadException(const std::string& message, const std::string& path)
    : SttMonException(ErrorInfo(ErrorCategory::REFERENCE, ErrorSeverity::ERROR,
                                message, path, "ReferenceScript")) {
}

const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NETWORK: return "Network";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::SUBTITLE: return "Subtitle";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::REFERENCE: return "Reference";
        case ErrorCategory::ALIGNMENT: return "Alignment";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        logError(error);
        
        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }
    
    // Invoked outside the lock so the callback may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context, 
                              const std::string& peer) {
    ErrorCategory category = ErrorCategory::UNKNOWN;
    ErrorSeverity severity = ErrorSeverity::ERROR;
    std::string details;
    
    if (const auto* known = dynamic_cast<const SttMonException*>(&e)) {
        category = known->getErrorInfo().category;
        severity = known->getErrorInfo().severity;
        details = known->getErrorInfo().details;
        ErrorInfo error(category, severity, known->getErrorInfo().message, details,
                        context.empty() ? known->getErrorInfo().context : context,
                        peer.empty() ? known->getErrorInfo().peer : peer);
        reportError(error);
        return;
    }
    
    ErrorInfo error(category, severity, e.what(), details, context, peer);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = callback;
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }
    
    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (error_history_.size() <= count) {
        return error_history_;
    }
    
    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category)
                << " - " << error.message;
    
    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }
    
    if (!error.peer.empty()) {
        log_message << " | Peer: " << error.peer;
    }
    
    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& peer) 
    : previous_context_(current_context_), previous_peer_(current_peer_) {
    current_context_ = context;
    if (!peer.empty()) {
        current_peer_ = peer;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_peer_ = previous_peer_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentPeer() {
    return current_peer_;
}

} // namespace utils
} // namespace sttmon
