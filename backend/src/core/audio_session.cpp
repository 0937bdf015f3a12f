#include "core/audio_session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <map>

namespace pitchscribe {
namespace core {

const std::vector<SessionStatus>& allowedTransitions(SessionStatus from) {
    static const std::map<SessionStatus, std::vector<SessionStatus>> table = {
        {SessionStatus::INITIALIZING, {SessionStatus::CONNECTED, SessionStatus::ERROR}},
        {SessionStatus::CONNECTED, {SessionStatus::RECORDING, SessionStatus::STOPPING, SessionStatus::ERROR}},
        {SessionStatus::RECORDING, {SessionStatus::STOPPING, SessionStatus::ERROR}},
        {SessionStatus::STOPPING, {SessionStatus::STOPPED, SessionStatus::ERROR}},
        {SessionStatus::STOPPED, {}},
        {SessionStatus::ERROR, {}}
    };
    return table.at(from);
}

bool isTransitionAllowed(SessionStatus from, SessionStatus to) {
    const auto& allowed = allowedTransitions(from);
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

bool isTerminalStatus(SessionStatus status) {
    return status == SessionStatus::STOPPED || status == SessionStatus::ERROR;
}

nlohmann::json SessionSnapshot::toJson() const {
    auto millis = [](std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    };

    nlohmann::json j = {
        {"session_id", id},
        {"status", statusToString(status)},
        {"audio_config", config.toJson()},
        {"created_at", millis(createdAt)},
        {"updated_at", millis(updatedAt)},
        {"segment_count", transcript.segmentCount()},
        {"word_count", transcript.wordCount()},
        {"provider_session_id", nullptr},
        {"error_message", nullptr}
    };
    if (binding) {
        j["provider_session_id"] = binding->providerSessionId;
    }
    if (errorMessage) {
        j["error_message"] = *errorMessage;
    }
    return j;
}

AudioSession::AudioSession(std::string id, audio::AudioConfiguration config, SessionEventSink* sink)
    : id_(std::move(id)), config_(std::move(config)), sink_(sink),
      createdAt_(Clock::now()), status_(SessionStatus::INITIALIZING), updatedAt_(createdAt_) {
}

SessionStatus AudioSession::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool AudioSession::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == SessionStatus::INITIALIZING ||
           status_ == SessionStatus::CONNECTED ||
           status_ == SessionStatus::RECORDING;
}

bool AudioSession::canReceiveAudio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_ == SessionStatus::CONNECTED || status_ == SessionStatus::RECORDING;
}

bool AudioSession::isTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isTerminalStatus(status_);
}

void AudioSession::transitionTo(SessionStatus target, const std::string& errorMessage) {
    SessionEvent event;
    std::optional<SessionEvent> errorEvent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isTransitionAllowed(status_, target)) {
            throw utils::TransitionException("Invalid transition from " + statusToString(status_) +
                                              " to " + statusToString(target), id_);
        }

        event.type = SessionEvent::Type::STATUS_CHANGED;
        event.sessionId = id_;
        event.previousStatus = status_;
        event.status = target;

        status_ = target;
        updatedAt_ = Clock::now();
        if (!errorMessage.empty()) {
            errorMessage_ = errorMessage;
        }

        if (target == SessionStatus::ERROR) {
            SessionEvent e;
            e.type = SessionEvent::Type::SESSION_ERROR;
            e.sessionId = id_;
            e.previousStatus = event.previousStatus;
            e.status = target;
            e.errorMessage = errorMessage_.value_or("unknown error");
            errorEvent = std::move(e);
        }
    }

    utils::Logger::debug("Session " + id_ + " " + statusToString(event.previousStatus) +
                         " -> " + statusToString(event.status));
    publish(std::move(event));
    if (errorEvent) {
        publish(std::move(*errorEvent));
    }
}

void AudioSession::addSegment(const stt::TranscriptSegment& segment) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool active = status_ == SessionStatus::INITIALIZING ||
                      status_ == SessionStatus::CONNECTED ||
                      status_ == SessionStatus::RECORDING;
        if (!active) {
            throw utils::InactiveSessionException("Cannot add transcript to " +
                                                  statusToString(status_) + " session", id_);
        }
        transcript_ = transcript_.addSegment(segment);
        updatedAt_ = Clock::now();
    }

    SessionEvent event;
    event.type = SessionEvent::Type::SEGMENT_ADDED;
    event.sessionId = id_;
    event.segment = segment;
    publish(std::move(event));
}

void AudioSession::replaceTranscript(const stt::TranscriptCollection& transcript) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool active = status_ == SessionStatus::INITIALIZING ||
                  status_ == SessionStatus::CONNECTED ||
                  status_ == SessionStatus::RECORDING;
    if (!active) {
        throw utils::InactiveSessionException("Cannot replace transcript of " +
                                              statusToString(status_) + " session", id_);
    }
    transcript_ = transcript;
    updatedAt_ = Clock::now();
}

void AudioSession::startRecording() {
    transitionTo(SessionStatus::RECORDING);
}

void AudioSession::stopRecording() {
    transitionTo(SessionStatus::STOPPING);
}

void AudioSession::markStopped() {
    transitionTo(SessionStatus::STOPPED);
}

void AudioSession::fail(const std::string& message) {
    transitionTo(SessionStatus::ERROR, message.empty() ? "unknown error" : message);
}

void AudioSession::bindProvider(ProviderBinding binding) {
    std::lock_guard<std::mutex> lock(mutex_);
    binding_ = std::move(binding);
    updatedAt_ = Clock::now();
}

std::optional<ProviderBinding> AudioSession::getBinding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binding_;
}

stt::TranscriptCollection AudioSession::getTranscript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

std::optional<std::string> AudioSession::getErrorMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorMessage_;
}

AudioSession::Clock::time_point AudioSession::getUpdatedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updatedAt_;
}

std::chrono::milliseconds AudioSession::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(updatedAt_ - createdAt_);
}

SessionSnapshot AudioSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SessionSnapshot{id_, config_, status_, createdAt_, updatedAt_,
                           binding_, transcript_, errorMessage_};
}

void AudioSession::publish(SessionEvent event) {
    if (sink_) {
        sink_->publish(std::move(event));
    }
}

} // namespace core
} // namespace pitchscribe
