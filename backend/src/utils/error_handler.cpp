#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <random>
#include <algorithm>

namespace pitchscribe {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::CONNECTION: return "Connection";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::TIMEOUT: return "Timeout";
        case ErrorCategory::SESSION_STATE: return "SessionState";
        case ErrorCategory::UPSTREAM_JOB: return "UpstreamJob";
        case ErrorCategory::SIZE_LIMIT: return "SizeLimit";
        case ErrorCategory::SCORING: return "Scoring";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    static std::mutex id_mutex;
    static std::mt19937 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    std::lock_guard<std::mutex> lock(id_mutex);
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

PitchScribeException::PitchScribeException(const ErrorInfo& error_info)
    : error_info_(error_info), what_message_(error_info.message) {
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

const char* PitchScribeException::what() const noexcept {
    return what_message_.c_str();
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : PitchScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                     message, details, "Configuration")) {
}

ConnectionException::ConnectionException(const std::string& message, const std::string& context)
    : PitchScribeException(ErrorInfo(ErrorCategory::CONNECTION, ErrorSeverity::ERROR,
                                     message, "", context.empty() ? "Connection" : context)) {
}

ProtocolException::ProtocolException(const std::string& message, const std::string& details)
    : PitchScribeException(ErrorInfo(ErrorCategory::PROTOCOL, ErrorSeverity::WARNING,
                                     message, details, "Protocol")) {
}

TimeoutException::TimeoutException(const std::string& message, const std::string& context)
    : PitchScribeException(ErrorInfo(ErrorCategory::TIMEOUT, ErrorSeverity::ERROR,
                                     message, "", context.empty() ? "Timeout" : context)) {
}

TransitionException::TransitionException(const std::string& message, const std::string& session_id)
    : PitchScribeException(ErrorInfo(ErrorCategory::SESSION_STATE, ErrorSeverity::ERROR,
                                     message, "", "Transition", session_id)) {
}

InactiveSessionException::InactiveSessionException(const std::string& message, const std::string& session_id)
    : PitchScribeException(ErrorInfo(ErrorCategory::SESSION_STATE, ErrorSeverity::ERROR,
                                     message, "", "InactiveSession", session_id)) {
}

SessionNotFoundException::SessionNotFoundException(const std::string& session_id)
    : PitchScribeException(ErrorInfo(ErrorCategory::SESSION_STATE, ErrorSeverity::WARNING,
                                     "Unknown session", session_id, "SessionLookup", session_id)) {
}

UpstreamJobException::UpstreamJobException(const std::string& message, const std::string& job_id)
    : PitchScribeException(ErrorInfo(ErrorCategory::UPSTREAM_JOB, ErrorSeverity::ERROR,
                                     message, job_id.empty() ? "" : "job " + job_id, "BatchJob")) {
}

SizeLimitExceededException::SizeLimitExceededException(size_t size_bytes, size_t limit_bytes)
    : PitchScribeException(ErrorInfo(ErrorCategory::SIZE_LIMIT, ErrorSeverity::WARNING,
                                     "Audio exceeds batch upload limit",
                                     std::to_string(size_bytes) + " > " + std::to_string(limit_bytes) + " bytes",
                                     "BatchUpload")) {
}

ScoringException::ScoringException(const std::string& message, const std::string& session_id)
    : PitchScribeException(ErrorInfo(ErrorCategory::SCORING, ErrorSeverity::WARNING,
                                     message, "", "Scoring", session_id)) {
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
        while (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    std::string ctx = context.empty() ? ErrorContext::getCurrentContext() : context;
    std::string sid = session_id.empty() ? ErrorContext::getCurrentSessionId() : session_id;

    if (auto pe = dynamic_cast<const PitchScribeException*>(&e)) {
        ErrorInfo error = pe->getErrorInfo();
        if (!ctx.empty()) {
            error.context = ctx;
        }
        if (!sid.empty()) {
            error.session_id = sid;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", ctx, sid);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
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

void ErrorHandler::setMaxHistorySize(size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = size == 0 ? 1 : size;
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

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
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

ErrorContext::ErrorContext(const std::string& context, const std::string& session_id)
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace pitchscribe
