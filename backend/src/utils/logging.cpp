#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pitchscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

} // namespace

void Logger::initialize(LogLevel level) {
    setLevel(level);
    if (!initialized_) {
        initialized_ = true;
        info("Logger initialized");
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, "[DEBUG] ", message);
}

void Logger::write(LogLevel level, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << timestamp() << ' ' << tag << message << std::endl;
}

} // namespace utils
} // namespace pitchscribe
