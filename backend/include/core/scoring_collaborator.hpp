#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "stt/audio_intelligence.hpp"
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace core {

/**
 * Downstream consumer of finalized sessions.
 * Called from a worker thread; implementations may throw ScoringException.
 */
class ScoringCollaborator {
public:
    virtual ~ScoringCollaborator() = default;

    virtual void handoff(const std::string& sessionId,
                         const stt::TranscriptCollection& transcript,
                         const stt::AudioIntelligenceReport& report) = 0;

    /**
     * Body sent downstream: session id, transcript and intelligence report.
     */
    static nlohmann::json buildPayload(const std::string& sessionId,
                                       const stt::TranscriptCollection& transcript,
                                       const stt::AudioIntelligenceReport& report);
};

/**
 * POSTs the handoff payload as JSON to a scoring endpoint.
 */
class HttpScoringCollaborator : public ScoringCollaborator {
public:
    HttpScoringCollaborator(std::string endpoint, std::chrono::milliseconds timeout);

    void handoff(const std::string& sessionId,
                 const stt::TranscriptCollection& transcript,
                 const stt::AudioIntelligenceReport& report) override;

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
};

// Used when no scoring endpoint is configured
class LoggingScoringCollaborator : public ScoringCollaborator {
public:
    void handoff(const std::string& sessionId,
                 const stt::TranscriptCollection& transcript,
                 const stt::AudioIntelligenceReport& report) override;
};

} // namespace core
} // namespace pitchscribe
