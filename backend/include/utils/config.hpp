#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace pitchscribe {
namespace utils {

struct ProviderSettings {
    std::string baseUrl = "https://api.gladia.io";
    std::string apiKey;
};

struct StreamingSettings {
    size_t chunkBytes = 4096;
    std::chrono::milliseconds chunkInterval{50};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readTimeout{3000};
    size_t maxMessages = 100;
    size_t maxConsecutiveTimeouts = 10;
};

struct BatchSettings {
    std::chrono::milliseconds pollInterval{2000};
    size_t maxPollAttempts = 30;
    std::chrono::milliseconds requestTimeout{30000};
    size_t maxUploadBytes = 10 * 1024 * 1024;
    bool deleteJobAfterCompletion = true;
};

struct IntelligenceSettings {
    double targetWpm = 150.0;
};

struct ScoringSettings {
    std::string endpoint;
    std::chrono::milliseconds requestTimeout{10000};
    size_t workerThreads = 2;
};

struct NotificationSettings {
    size_t queueCapacity = 256;
};

/**
 * Service configuration loaded from a JSON file. Every section is optional;
 * absent keys keep their defaults.
 */
class Config {
public:
    static Config defaults();

    /**
     * Load configuration from a JSON file. A missing file yields defaults.
     * @throws ConfigurationException on malformed JSON or invalid values
     */
    static Config load(const std::string& configPath);

    /**
     * @throws ConfigurationException on malformed or invalid content
     */
    static Config fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    /**
     * @throws ConfigurationException naming the first invalid setting
     */
    void validate() const;

    int getPort() const { return port_; }
    void setPort(int port) { port_ = port; }
    std::string getLogLevel() const { return logLevel_; }

    const ProviderSettings& provider() const { return provider_; }
    const StreamingSettings& streaming() const { return streaming_; }
    const BatchSettings& batch() const { return batch_; }
    const IntelligenceSettings& intelligence() const { return intelligence_; }
    const ScoringSettings& scoring() const { return scoring_; }
    const NotificationSettings& notifications() const { return notifications_; }

    ProviderSettings& provider() { return provider_; }
    StreamingSettings& streaming() { return streaming_; }
    BatchSettings& batch() { return batch_; }
    ScoringSettings& scoring() { return scoring_; }

private:
    Config() = default;

    int port_ = 8080;
    std::string logLevel_ = "INFO";
    ProviderSettings provider_;
    StreamingSettings streaming_;
    BatchSettings batch_;
    IntelligenceSettings intelligence_;
    ScoringSettings scoring_;
    NotificationSettings notifications_;
};

} // namespace utils
} // namespace pitchscribe
