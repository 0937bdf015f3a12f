#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/audio_configuration.hpp"
#include "core/session_events.hpp"
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace core {

/**
 * Statuses reachable from the given status. Empty for terminal statuses.
 */
const std::vector<SessionStatus>& allowedTransitions(SessionStatus from);
bool isTransitionAllowed(SessionStatus from, SessionStatus to);
bool isTerminalStatus(SessionStatus status);

struct ProviderBinding {
    std::string providerSessionId;
    std::string websocketUrl;
};

struct SessionSnapshot {
    std::string id;
    audio::AudioConfiguration config;
    SessionStatus status;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<ProviderBinding> binding;
    stt::TranscriptCollection transcript;
    std::optional<std::string> errorMessage;

    nlohmann::json toJson() const;
};

/**
 * One recording session and its status state machine.
 *
 * INITIALIZING -> CONNECTED | ERROR
 * CONNECTED    -> RECORDING | STOPPING | ERROR
 * RECORDING    -> STOPPING | ERROR
 * STOPPING     -> STOPPED | ERROR
 * STOPPED, ERROR are terminal.
 *
 * All members are thread-safe. Events are published after the session lock is released.
 */
class AudioSession {
public:
    using Clock = std::chrono::system_clock;

    AudioSession(std::string id, audio::AudioConfiguration config, SessionEventSink* sink = nullptr);

    AudioSession(const AudioSession&) = delete;
    AudioSession& operator=(const AudioSession&) = delete;

    const std::string& getId() const { return id_; }
    const audio::AudioConfiguration& getConfig() const { return config_; }

    SessionStatus getStatus() const;

    // INITIALIZING counts as active: segments may arrive before audio flows
    bool isActive() const;
    bool canReceiveAudio() const;
    bool isTerminal() const;

    /**
     * @throws TransitionException if target is not allowed from the current status
     */
    void transitionTo(SessionStatus target, const std::string& errorMessage = "");

    /**
     * @throws InactiveSessionException unless the session is active
     */
    void addSegment(const stt::TranscriptSegment& segment);

    /**
     * Swap in a transcript produced by another path, e.g. the batch fallback.
     * @throws InactiveSessionException unless the session is active
     */
    void replaceTranscript(const stt::TranscriptCollection& transcript);

    void startRecording();                      // CONNECTED -> RECORDING
    void stopRecording();                       // CONNECTED | RECORDING -> STOPPING
    void markStopped();                         // STOPPING -> STOPPED
    void fail(const std::string& message);      // -> ERROR

    void bindProvider(ProviderBinding binding);
    std::optional<ProviderBinding> getBinding() const;

    stt::TranscriptCollection getTranscript() const;
    std::optional<std::string> getErrorMessage() const;
    Clock::time_point getCreatedAt() const { return createdAt_; }
    Clock::time_point getUpdatedAt() const;
    std::chrono::milliseconds duration() const;

    SessionSnapshot snapshot() const;

private:
    void publish(SessionEvent event);

    const std::string id_;
    const audio::AudioConfiguration config_;
    SessionEventSink* sink_;
    const Clock::time_point createdAt_;

    mutable std::mutex mutex_;
    SessionStatus status_;
    Clock::time_point updatedAt_;
    std::optional<ProviderBinding> binding_;
    stt::TranscriptCollection transcript_;
    std::optional<std::string> errorMessage_;
};

} // namespace core
} // namespace pitchscribe
