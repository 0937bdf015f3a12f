#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/audio_configuration.hpp"
#include "utils/config.hpp"

namespace pitchscribe {
namespace stt {

struct LiveSessionInfo {
    std::string id;
    std::string url;
};

struct SubmittedJob {
    std::string id;
    std::string resultUrl;
};

struct JobStatus {
    enum class State {
        QUEUED,
        PROCESSING,
        DONE,
        ERROR
    };

    State state = State::QUEUED;
    std::string rawStatus;
    std::string errorMessage;
    nlohmann::json payload;   // full job document, result included once DONE
};

/**
 * HTTP side of the transcription provider.
 * Every call throws ConnectionException on transport or HTTP failure and
 * TimeoutException when the request timeout elapses.
 */
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    virtual LiveSessionInfo createLiveSession(const audio::AudioConfiguration& config) = 0;

    /**
     * Multipart upload of a complete recording. Returns the content reference.
     */
    virtual std::string uploadAudio(const std::vector<uint8_t>& audio, const std::string& filename) = 0;

    virtual SubmittedJob submitTranscription(const std::string& audioUrl,
                                             const audio::AudioConfiguration& config) = 0;

    virtual JobStatus fetchJob(const std::string& resultUrl) = 0;

    virtual void deleteJob(const std::string& jobId) = 0;
};

/**
 * Gladia v2 API over cpr.
 */
class GladiaProviderClient : public ProviderClient {
public:
    GladiaProviderClient(utils::ProviderSettings settings, std::chrono::milliseconds requestTimeout);

    LiveSessionInfo createLiveSession(const audio::AudioConfiguration& config) override;
    std::string uploadAudio(const std::vector<uint8_t>& audio, const std::string& filename) override;
    SubmittedJob submitTranscription(const std::string& audioUrl,
                                     const audio::AudioConfiguration& config) override;
    JobStatus fetchJob(const std::string& resultUrl) override;
    void deleteJob(const std::string& jobId) override;

    static JobStatus::State parseJobState(const std::string& status);

private:
    std::string endpoint(const std::string& path) const;

    utils::ProviderSettings settings_;
    std::chrono::milliseconds requestTimeout_;
};

} // namespace stt
} // namespace pitchscribe
