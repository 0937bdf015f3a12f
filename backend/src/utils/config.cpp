#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <fstream>

namespace pitchscribe {
namespace utils {

namespace {

template <typename T>
void readValue(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void readMillis(const nlohmann::json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        target = std::chrono::milliseconds(section.at(key).get<long long>());
    }
}

void readSize(const nlohmann::json& section, const char* key, size_t& target) {
    if (section.contains(key)) {
        long long value = section.at(key).get<long long>();
        if (value <= 0) {
            throw ConfigurationException("Setting must be positive", key);
        }
        target = static_cast<size_t>(value);
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name)) {
        return empty;
    }
    const auto& s = j.at(name);
    if (!s.is_object()) {
        throw ConfigurationException("Configuration section must be an object", name);
    }
    return s;
}

void requirePositive(std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
        throw ConfigurationException("Setting must be positive", name);
    }
}

} // namespace

Config Config::defaults() {
    Config config;
    if (const char* key = std::getenv("GLADIA_API_KEY")) {
        config.provider_.apiKey = key;
    }
    return config;
}

Config Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file " + configPath + " not found, using defaults");
        return defaults();
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("Malformed configuration file " + configPath, e.what());
    }

    Config config = fromJson(j);
    Logger::info("Loaded configuration from " + configPath);
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationException("Configuration root must be an object");
    }

    Config config = defaults();
    try {
        const auto& server = section(j, "server");
        readValue(server, "port", config.port_);

        const auto& logging = section(j, "logging");
        readValue(logging, "level", config.logLevel_);

        const auto& provider = section(j, "provider");
        readValue(provider, "base_url", config.provider_.baseUrl);
        readValue(provider, "api_key", config.provider_.apiKey);

        const auto& streaming = section(j, "streaming");
        readSize(streaming, "chunk_bytes", config.streaming_.chunkBytes);
        readMillis(streaming, "chunk_interval_ms", config.streaming_.chunkInterval);
        readMillis(streaming, "connect_timeout_ms", config.streaming_.connectTimeout);
        readMillis(streaming, "read_timeout_ms", config.streaming_.readTimeout);
        readSize(streaming, "max_messages", config.streaming_.maxMessages);
        readSize(streaming, "max_consecutive_timeouts", config.streaming_.maxConsecutiveTimeouts);

        const auto& batch = section(j, "batch");
        readMillis(batch, "poll_interval_ms", config.batch_.pollInterval);
        readSize(batch, "max_poll_attempts", config.batch_.maxPollAttempts);
        readMillis(batch, "request_timeout_ms", config.batch_.requestTimeout);
        readSize(batch, "max_upload_bytes", config.batch_.maxUploadBytes);
        readValue(batch, "delete_job_after_completion", config.batch_.deleteJobAfterCompletion);

        const auto& intelligence = section(j, "intelligence");
        readValue(intelligence, "target_wpm", config.intelligence_.targetWpm);

        const auto& scoring = section(j, "scoring");
        readValue(scoring, "endpoint", config.scoring_.endpoint);
        readMillis(scoring, "request_timeout_ms", config.scoring_.requestTimeout);
        readSize(scoring, "worker_threads", config.scoring_.workerThreads);

        const auto& notifications = section(j, "notifications");
        readSize(notifications, "queue_capacity", config.notifications_.queueCapacity);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("Invalid configuration value", e.what());
    }

    config.validate();
    return config;
}

nlohmann::json Config::toJson() const {
    return {
        {"server", {{"port", port_}}},
        {"logging", {{"level", logLevel_}}},
        {"provider", {{"base_url", provider_.baseUrl}}},
        {"streaming", {
            {"chunk_bytes", streaming_.chunkBytes},
            {"chunk_interval_ms", streaming_.chunkInterval.count()},
            {"connect_timeout_ms", streaming_.connectTimeout.count()},
            {"read_timeout_ms", streaming_.readTimeout.count()},
            {"max_messages", streaming_.maxMessages},
            {"max_consecutive_timeouts", streaming_.maxConsecutiveTimeouts}
        }},
        {"batch", {
            {"poll_interval_ms", batch_.pollInterval.count()},
            {"max_poll_attempts", batch_.maxPollAttempts},
            {"request_timeout_ms", batch_.requestTimeout.count()},
            {"max_upload_bytes", batch_.maxUploadBytes},
            {"delete_job_after_completion", batch_.deleteJobAfterCompletion}
        }},
        {"intelligence", {{"target_wpm", intelligence_.targetWpm}}},
        {"scoring", {
            {"endpoint", scoring_.endpoint},
            {"request_timeout_ms", scoring_.requestTimeout.count()},
            {"worker_threads", scoring_.workerThreads}
        }},
        {"notifications", {{"queue_capacity", notifications_.queueCapacity}}}
    };
}

void Config::validate() const {
    if (port_ < 1 || port_ > 65535) {
        throw ConfigurationException("Port out of range", std::to_string(port_));
    }
    if (provider_.baseUrl.empty()) {
        throw ConfigurationException("Provider base URL must not be empty");
    }
    // chunk interval may be zero to disable pacing
    if (streaming_.chunkInterval.count() < 0) {
        throw ConfigurationException("Setting must not be negative", "chunk_interval_ms");
    }
    requirePositive(streaming_.connectTimeout, "connect_timeout_ms");
    requirePositive(streaming_.readTimeout, "read_timeout_ms");
    if (batch_.pollInterval.count() < 0) {
        throw ConfigurationException("Setting must not be negative", "poll_interval_ms");
    }
    requirePositive(batch_.requestTimeout, "request_timeout_ms");
    requirePositive(scoring_.requestTimeout, "scoring.request_timeout_ms");
    if (intelligence_.targetWpm <= 0.0) {
        throw ConfigurationException("Setting must be positive", "target_wpm");
    }
}

} // namespace utils
} // namespace pitchscribe
