#include "core/session_orchestrator.hpp"
#include "stt/transcript_assembler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <mutex>
#include <random>
#include <sstream>

namespace pitchscribe {
namespace core {

namespace {

/**
 * Clears the stop flag of a session on every exit path of stopSession.
 */
class StopFlagGuard {
public:
    explicit StopFlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~StopFlagGuard() { flag_.store(false); }

    StopFlagGuard(const StopFlagGuard&) = delete;
    StopFlagGuard& operator=(const StopFlagGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

nlohmann::json SessionOutcome::toJson() const {
    nlohmann::json j = {
        {"session", snapshot.toJson()},
        {"transcript", transcript.toJson()},
        {"summary", stt::TranscriptAssembler::summarize(transcript).toJson()},
        {"warnings", warnings},
        {"used_batch", usedBatch},
        {"streaming_stop_reason", nullptr},
        {"intelligence", nullptr}
    };
    if (streamingStopReason) {
        j["streaming_stop_reason"] = stt::stopReasonToString(*streamingStopReason);
    }
    if (report) {
        j["intelligence"] = report->toJson();
    }
    return j;
}

SessionOrchestrator::SessionOrchestrator(const utils::Config& config,
                                         stt::RealtimeConnector& connector,
                                         stt::ProviderClient& providerClient,
                                         std::shared_ptr<ScoringCollaborator> scoring)
    : config_(config),
      providerClient_(providerClient),
      scoring_(std::move(scoring)),
      streaming_(connector, config.streaming()),
      batch_(providerClient, config.batch()),
      extractor_(config.intelligence().targetWpm),
      notifications_(std::make_unique<NotificationChannel>(config.notifications().queueCapacity)),
      handoffQueue_(std::make_shared<TaskQueue>()),
      handoffPool_(std::make_unique<ThreadPool>(config.scoring().workerThreads)) {
    if (!scoring_) {
        scoring_ = std::make_shared<LoggingScoringCollaborator>();
    }
    handoffPool_->start(handoffQueue_);
}

SessionOrchestrator::~SessionOrchestrator() {
    shutdown();
}

std::string SessionOrchestrator::createSession(const audio::AudioConfiguration& config) {
    const std::string id = generateSessionId();
    utils::ErrorContext context("CreateSession", id);

    auto session = std::make_shared<AudioSession>(id, config, notifications_.get());
    registry_.add(std::make_shared<SessionRecord>(session));

    try {
        bindProvider(*session);
    } catch (const utils::PitchScribeException& e) {
        utils::Logger::warn("Provider bind failed for session " + id + ", will retry at stop: " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "CreateSession", id);
    }

    session->transitionTo(SessionStatus::CONNECTED);
    utils::Logger::info("Created session " + id + " (" +
                        audio::encodingToString(config.getEncoding()) + ", " +
                        std::to_string(config.getSampleRate()) + " Hz, " +
                        std::to_string(config.getChannels()) + " ch)");
    return id;
}

void SessionOrchestrator::feedAudio(const std::string& sessionId, const std::vector<uint8_t>& bytes) {
    auto record = registry_.get(sessionId);
    auto& session = *record->session;

    // checks and append are atomic with respect to stop and cancel
    std::lock_guard<std::mutex> lock(record->audioMutex);
    if (record->stopInProgress.load()) {
        throw utils::InactiveSessionException("Session is stopping", sessionId);
    }
    if (!session.canReceiveAudio()) {
        throw utils::InactiveSessionException("Cannot feed audio to " +
                                              statusToString(session.getStatus()) + " session", sessionId);
    }
    if (bytes.empty()) {
        return;
    }

    record->audioBuffer.insert(record->audioBuffer.end(), bytes.begin(), bytes.end());
    if (session.getStatus() == SessionStatus::CONNECTED) {
        session.startRecording();
    }
}

SessionOutcome SessionOrchestrator::stopSession(const std::string& sessionId,
                                                const std::vector<uint8_t>& finalAudio) {
    auto record = registry_.get(sessionId);
    auto& session = *record->session;

    std::vector<uint8_t> audio;
    {
        std::lock_guard<std::mutex> lock(record->audioMutex);
        if (record->stopInProgress.load()) {
            throw utils::TransitionException("Stop already in progress", sessionId);
        }
        if (!session.canReceiveAudio()) {
            throw utils::TransitionException("Cannot stop " + statusToString(session.getStatus()) +
                                             " session", sessionId);
        }
        record->stopInProgress.store(true);
        if (!finalAudio.empty()) {
            record->audioBuffer = finalAudio;
        }
        audio.swap(record->audioBuffer);
    }
    StopFlagGuard guard(record->stopInProgress);

    try {
        return finalize(*record, audio);
    } catch (const std::exception& e) {
        utils::Logger::error("Stopping session " + sessionId + " failed: " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "StopSession", sessionId);
        if (!session.isTerminal()) {
            session.fail(std::string("Session finalization failed: ") + e.what());
        }
        throw;
    }
}

SessionOutcome SessionOrchestrator::finalize(SessionRecord& record, const std::vector<uint8_t>& audio) {
    auto& session = *record.session;
    const std::string& id = session.getId();
    utils::ErrorContext context("StopSession", id);

    SessionOutcome outcome{session.snapshot()};
    PathState paths;
    std::optional<stt::IntelligenceAnnotations> annotations;

    if (audio.empty()) {
        outcome.warnings.push_back("No audio received");
        utils::Logger::warn("Session " + id + " stopped without audio");
    } else {
        bool streamingBroke = runStreaming(record, audio, outcome, paths);
        if (shouldRunBatch(record, streamingBroke)) {
            annotations = runBatch(record, audio, outcome, paths);
        }
    }

    session.stopRecording();
    outcome.transcript = session.getTranscript();

    bool cancelled = record.cancellation->isCancelled();
    bool everyPathFailed = paths.attempted > 0 && paths.failed == paths.attempted;
    if (outcome.transcript.isEmpty() && (cancelled || everyPathFailed)) {
        std::string message = cancelled ? "Session cancelled"
                                         : "No transcript recovered: " + paths.lastError;
        session.fail(message);
        outcome.snapshot = session.snapshot();
        utils::Logger::warn("Session " + id + " ended in ERROR: " + message);
        return outcome;
    }

    auto report = extractor_.analyze(stt::TranscriptAssembler::analysisView(outcome.transcript), annotations);
    session.markStopped();

    outcome.report = report;
    outcome.snapshot = session.snapshot();

    std::ostringstream oss;
    oss << "Session " << id << " stopped with " << outcome.transcript.segmentCount()
        << " segments" << (outcome.usedBatch ? " (batch)" : "")
        << ", delivery score " << report.deliveryScore;
    utils::Logger::info(oss.str());

    scheduleHandoff(id, outcome.transcript, report);
    return outcome;
}

bool SessionOrchestrator::runStreaming(SessionRecord& record, const std::vector<uint8_t>& audio,
                                       SessionOutcome& outcome, PathState& paths) {
    auto& session = *record.session;
    const std::string& id = session.getId();
    ++paths.attempted;

    auto pathFailed = [&](const std::exception& e) {
        ++paths.failed;
        paths.lastError = e.what();
        outcome.warnings.push_back(std::string("Streaming transcription failed: ") + e.what());
        utils::Logger::warn("Streaming path failed for session " + id + ": " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "StreamingTranscription", id);
    };

    try {
        if (!session.getBinding()) {
            bindProvider(session);
        }
        auto binding = session.getBinding();

        auto result = streaming_.run(binding->websocketUrl, audio, *record.cancellation, id,
                                     [&session](const stt::TranscriptSegment& segment) {
                                         session.addSegment(segment);
                                     });
        outcome.streamingStopReason = result.stopReason;

        if (result.malformedMessages > 0) {
            outcome.warnings.push_back(std::to_string(result.malformedMessages) +
                                       " malformed provider messages ignored");
        }
        if (result.endedWithError()) {
            ++paths.failed;
            paths.lastError = result.errorMessage;
            outcome.warnings.push_back("Streaming ended early: " + result.errorMessage);
            return true;
        }
        return false;
    } catch (const utils::ConnectionException& e) {
        pathFailed(e);
    } catch (const utils::TimeoutException& e) {
        pathFailed(e);
    } catch (const utils::ProtocolException& e) {
        pathFailed(e);
    }
    return true;
}

bool SessionOrchestrator::shouldRunBatch(const SessionRecord& record, bool streamingBroke) const {
    if (!record.session->getConfig().requiresBatchForFullFidelity()) {
        return false;
    }
    if (record.cancellation->isCancelled()) {
        return false;
    }
    return streamingBroke || record.session->getTranscript().isEmpty();
}

std::optional<stt::IntelligenceAnnotations> SessionOrchestrator::runBatch(SessionRecord& record,
                                                                          const std::vector<uint8_t>& audio,
                                                                          SessionOutcome& outcome,
                                                                          PathState& paths) {
    auto& session = *record.session;
    const std::string& id = session.getId();
    ++paths.attempted;
    utils::Logger::info("Falling back to batch transcription for session " + id);

    try {
        auto result = batch_.run(audio, session.getConfig(), *record.cancellation, id);
        if (result.cancelled) {
            ++paths.failed;
            paths.lastError = "Batch transcription cancelled";
            outcome.warnings.push_back(paths.lastError);
            return std::nullopt;
        }

        outcome.usedBatch = true;
        if (result.segments.empty()) {
            outcome.warnings.push_back("Batch transcription returned no utterances");
        } else {
            session.replaceTranscript(stt::TranscriptAssembler::fromSegments(result.segments));
        }
        if (result.annotations.empty()) {
            return std::nullopt;
        }
        return result.annotations;
    } catch (const utils::SizeLimitExceededException& e) {
        ++paths.failed;
        paths.lastError = e.what();
        outcome.warnings.push_back(std::string("Batch transcription skipped: ") + e.what());
        utils::Logger::warn("Batch path skipped for session " + id + ": " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "BatchTranscription", id);
    } catch (const utils::PitchScribeException& e) {
        ++paths.failed;
        paths.lastError = e.what();
        outcome.warnings.push_back(std::string("Batch transcription failed: ") + e.what());
        utils::Logger::warn("Batch path failed for session " + id + ": " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "BatchTranscription", id);
    }
    return std::nullopt;
}

void SessionOrchestrator::bindProvider(AudioSession& session) {
    auto info = providerClient_.createLiveSession(session.getConfig());
    session.bindProvider(ProviderBinding{info.id, info.url});
    utils::Logger::debug("Session " + session.getId() + " bound to provider session " + info.id);
}

void SessionOrchestrator::scheduleHandoff(const std::string& sessionId,
                                          const stt::TranscriptCollection& transcript,
                                          const stt::AudioIntelligenceReport& report) {
    auto scoring = scoring_;
    bool queued = handoffQueue_->enqueue("scoring-handoff:" + sessionId,
        [scoring, sessionId, transcript, report]() {
            try {
                scoring->handoff(sessionId, transcript, report);
            } catch (const std::exception& e) {
                utils::Logger::warn("Scoring handoff failed for session " + sessionId + ": " + e.what());
                utils::ErrorHandler::getInstance().reportError(e, "ScoringHandoff", sessionId);
            }
        });

    if (!queued) {
        utils::Logger::warn("Scoring handoff dropped for session " + sessionId + ": shutting down");
    }
}

SessionSnapshot SessionOrchestrator::getSessionState(const std::string& sessionId) const {
    return registry_.get(sessionId)->session->snapshot();
}

bool SessionOrchestrator::cancelSession(const std::string& sessionId) {
    auto record = registry_.get(sessionId);

    // a stop either has not claimed the session yet, and then sees ERROR,
    // or owns it and observes the token
    std::lock_guard<std::mutex> lock(record->audioMutex);
    if (record->session->isTerminal()) {
        return false;
    }

    record->cancellation->cancel();
    if (record->stopInProgress.load()) {
        utils::Logger::info("Cancellation requested for stopping session " + sessionId);
        return true;
    }

    record->session->fail("Session cancelled");
    record->audioBuffer.clear();
    utils::Logger::info("Cancelled session " + sessionId);
    return true;
}

bool SessionOrchestrator::releaseSession(const std::string& sessionId) {
    auto record = registry_.find(sessionId);
    if (!record) {
        return false;
    }
    if (!record->session->isTerminal()) {
        record->cancellation->cancel();
    }
    return registry_.remove(sessionId);
}

size_t SessionOrchestrator::purgeTerminalSessions(std::chrono::milliseconds maxAge) {
    return registry_.purgeTerminal(maxAge);
}

size_t SessionOrchestrator::activeSessionCount() const {
    return registry_.activeCount();
}

size_t SessionOrchestrator::sessionCount() const {
    return registry_.size();
}

void SessionOrchestrator::subscribe(std::shared_ptr<SessionObserver> observer) {
    notifications_->subscribe(std::move(observer));
}

void SessionOrchestrator::unsubscribe(const std::shared_ptr<SessionObserver>& observer) {
    notifications_->unsubscribe(observer);
}

void SessionOrchestrator::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    for (const auto& id : registry_.ids()) {
        auto record = registry_.find(id);
        if (record && !record->session->isTerminal()) {
            record->cancellation->cancel();
        }
    }

    handoffPool_->stop();
    notifications_->shutdown();
    utils::Logger::info("Session orchestrator shut down");
}

std::string SessionOrchestrator::generateSessionId() {
    static std::mutex mutex;
    static std::mt19937_64 gen(std::random_device{}());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "sess_";
    std::lock_guard<std::mutex> lock(mutex);
    for (int i = 0; i < 16; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

} // namespace core
} // namespace pitchscribe
