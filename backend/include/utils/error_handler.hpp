#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace pitchscribe {
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
 * Error categories, one per failure family a session can run into
 */
enum class ErrorCategory {
    CONFIGURATION,
    CONNECTION,
    PROTOCOL,
    TIMEOUT,
    SESSION_STATE,
    UPSTREAM_JOB,
    SIZE_LIMIT,
    SCORING,
    SYSTEM,
    UNKNOWN
};

std::string categoryToString(ErrorCategory category);

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
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base class of every exception raised by PitchScribe components
 */
class PitchScribeException : public std::exception {
public:
    explicit PitchScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }
    ErrorCategory category() const { return error_info_.category; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

class ConfigurationException : public PitchScribeException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

class ConnectionException : public PitchScribeException {
public:
    ConnectionException(const std::string& message, const std::string& context = "");
};

class ProtocolException : public PitchScribeException {
public:
    ProtocolException(const std::string& message, const std::string& details = "");
};

class TimeoutException : public PitchScribeException {
public:
    TimeoutException(const std::string& message, const std::string& context = "");
};

/**
 * Requested status change is not in the transition table. The session is left untouched.
 */
class TransitionException : public PitchScribeException {
public:
    TransitionException(const std::string& message, const std::string& session_id = "");
};

class InactiveSessionException : public PitchScribeException {
public:
    InactiveSessionException(const std::string& message, const std::string& session_id = "");
};

class SessionNotFoundException : public PitchScribeException {
public:
    explicit SessionNotFoundException(const std::string& session_id);
};

class UpstreamJobException : public PitchScribeException {
public:
    UpstreamJobException(const std::string& message, const std::string& job_id = "");
};

class SizeLimitExceededException : public PitchScribeException {
public:
    SizeLimitExceededException(size_t size_bytes, size_t limit_bytes);
};

class ScoringException : public PitchScribeException {
public:
    ScoringException(const std::string& message, const std::string& session_id = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide error sink. Keeps a bounded history for diagnostics.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    // UNKNOWN counts every recorded error
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    mutable std::mutex mutex_;
    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;
};

/**
 * RAII helper for error context (operation name and session id) on the current thread
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

} // namespace utils
} // namespace pitchscribe
