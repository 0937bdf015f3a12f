#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/audio_configuration.hpp"
#include "core/audio_session.hpp"
#include "core/scoring_collaborator.hpp"
#include "core/session_events.hpp"
#include "core/session_registry.hpp"
#include "core/task_queue.hpp"
#include "stt/audio_intelligence.hpp"
#include "stt/batch_pipeline.hpp"
#include "stt/provider_client.hpp"
#include "stt/realtime_connection.hpp"
#include "stt/streaming_channel.hpp"
#include "stt/transcript.hpp"
#include "utils/config.hpp"

namespace pitchscribe {
namespace core {

/**
 * Result of stopping a session.
 */
struct SessionOutcome {
    SessionSnapshot snapshot;
    stt::TranscriptCollection transcript;
    std::optional<stt::AudioIntelligenceReport> report;   // absent when the session ended in ERROR
    std::vector<std::string> warnings;
    bool usedBatch = false;
    std::optional<stt::StreamStopReason> streamingStopReason;

    bool succeeded() const { return snapshot.status == SessionStatus::STOPPED; }

    nlohmann::json toJson() const;
};

/**
 * Drives sessions from creation to handoff.
 *
 * Audio fed to a session is buffered. On stop the buffer is streamed to the
 * provider's realtime endpoint; when that yields nothing (or breaks) and the
 * configuration asks for provider-side analysis, the batch pipeline runs once.
 * The recovered transcript is analysed and handed to the scoring collaborator
 * on a worker thread.
 */
class SessionOrchestrator {
public:
    SessionOrchestrator(const utils::Config& config,
                        stt::RealtimeConnector& connector,
                        stt::ProviderClient& providerClient,
                        std::shared_ptr<ScoringCollaborator> scoring);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * Register a session and bind it to a provider realtime session. A failed
     * bind is retried once at stop.
     * @return the new session id
     */
    std::string createSession(const audio::AudioConfiguration& config);

    /**
     * @throws SessionNotFoundException for an unknown id
     * @throws InactiveSessionException unless the session can receive audio
     */
    void feedAudio(const std::string& sessionId, const std::vector<uint8_t>& bytes);

    /**
     * Run the transcription paths over the buffered audio and finalize the
     * session. A non-empty finalAudio replaces the buffered audio.
     * @throws SessionNotFoundException for an unknown id
     * @throws TransitionException if the session is not recording or a stop is already running
     */
    SessionOutcome stopSession(const std::string& sessionId,
                               const std::vector<uint8_t>& finalAudio = {});

    /**
     * @throws SessionNotFoundException for an unknown id
     */
    SessionSnapshot getSessionState(const std::string& sessionId) const;

    /**
     * Interrupt a running stop, or fail a session that has not been stopped yet.
     * @return false if the session was already terminal
     */
    bool cancelSession(const std::string& sessionId);

    bool releaseSession(const std::string& sessionId);
    size_t purgeTerminalSessions(std::chrono::milliseconds maxAge);

    size_t activeSessionCount() const;
    size_t sessionCount() const;

    void subscribe(std::shared_ptr<SessionObserver> observer);
    void unsubscribe(const std::shared_ptr<SessionObserver>& observer);

    /**
     * Cancel running sessions, finish queued handoffs and stop event delivery.
     */
    void shutdown();

    NotificationChannel& notifications() { return *notifications_; }

private:
    struct PathState {
        size_t attempted = 0;
        size_t failed = 0;
        std::string lastError;
    };

    SessionOutcome finalize(SessionRecord& record, const std::vector<uint8_t>& audio);

    // true when the realtime path broke rather than finished
    bool runStreaming(SessionRecord& record, const std::vector<uint8_t>& audio,
                      SessionOutcome& outcome, PathState& paths);
    bool shouldRunBatch(const SessionRecord& record, bool streamingBroke) const;
    std::optional<stt::IntelligenceAnnotations> runBatch(SessionRecord& record,
                                                         const std::vector<uint8_t>& audio,
                                                         SessionOutcome& outcome, PathState& paths);

    // @throws ConnectionException, TimeoutException or ProtocolException from the provider
    void bindProvider(AudioSession& session);
    void scheduleHandoff(const std::string& sessionId, const stt::TranscriptCollection& transcript,
                         const stt::AudioIntelligenceReport& report);

    static std::string generateSessionId();

    utils::Config config_;
    stt::ProviderClient& providerClient_;
    std::shared_ptr<ScoringCollaborator> scoring_;

    stt::StreamingTranscriptionChannel streaming_;
    stt::BatchTranscriptionPipeline batch_;
    stt::AudioIntelligenceExtractor extractor_;

    std::unique_ptr<NotificationChannel> notifications_;
    SessionRegistry registry_;
    std::shared_ptr<TaskQueue> handoffQueue_;
    std::unique_ptr<ThreadPool> handoffPool_;
    std::atomic<bool> shutdown_{false};
};

} // namespace core
} // namespace pitchscribe
