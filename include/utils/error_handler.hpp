#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace sttmon {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories used to classify reports from the monitor collaborators
 */
enum class ErrorCategory {
    NETWORK,
    PROTOCOL,
    SUBTITLE,
    CONFIGURATION,
    REFERENCE,
    ALIGNMENT,
    SYSTEM,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string peer;
    
    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
              const std::string& det = "", const std::string& ctx = "", 
              const std::string& peer_addr = "");
};

/**
 * Exception hierarchy thrown by the collaborators (never by the engine)
 */
class SttMonException : public std::exception {
public:
    explicit SttMonException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class NetworkException : public SttMonException {
public:
    NetworkException(const std::string& message, const std::string& details = "",
                     const std::string& peer = "");
};

class ProtocolException : public SttMonException {
public:
    ProtocolException(const std::string& message, const std::string& details = "");
};

class ConfigurationException : public SttMonException {
public:
    ConfigurationException(const std::string& message, const std::string& key = "");
};

class ReferenceLoadException : public SttMonException {
public:
    ReferenceLoadException(const std::string& message, const std::string& path = "");
};

const char* categoryToString(ErrorCategory category);
const char* severityToString(ErrorSeverity severity);

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();
    
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "", 
                    const std::string& peer = "");
    
    void setErrorCallback(ErrorCallback callback);
    
    // UNKNOWN counts every recorded error
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    
    void logError(const ErrorInfo& error);
    
    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;
    
    mutable std::mutex mutex_;
};

/**
 * RAII error context manager. Client threads use it to tag reports with
 * the peer they are serving.
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& peer = "");
    ~ErrorContext();
    
    static std::string getCurrentContext();
    static std::string getCurrentPeer();

private:
    std::string previous_context_;
    std::string previous_peer_;
    
    static thread_local std::string current_context_;
    static thread_local std::string current_peer_;
};

#define HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::sttmon::utils::ErrorInfo error_(category, severity, message, details, \
                       ::sttmon::utils::ErrorContext::getCurrentContext(), \
                       ::sttmon::utils::ErrorContext::getCurrentPeer()); \
        ::sttmon::utils::ErrorHandler::getInstance().reportError(error_); \
    } while(0)

#define HANDLE_EXCEPTION(e, context) \
    ::sttmon::utils::ErrorHandler::getInstance().reportError( \
        e, context, ::sttmon::utils::ErrorContext::getCurrentPeer())

} // namespace utils
} // namespace sttmon
