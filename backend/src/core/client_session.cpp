#include "core/client_session.hpp"
#include "core/message_protocol.hpp"
#include "core/session_orchestrator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace pitchscribe {
namespace core {

ClientSession::ClientSession(const std::string& connectionId, SessionOrchestrator& orchestrator)
    : connectionId_(connectionId), orchestrator_(orchestrator), connected_(true) {
}

std::string ClientSession::getActiveSessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeSessionId_;
}

bool ClientSession::ownsSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !activeSessionId_.empty() && activeSessionId_ == sessionId;
}

void ClientSession::handleMessage(const std::string& message) {
    utils::Logger::debug("Connection " + connectionId_ + " received JSON: " + message);

    if (!connected_) {
        utils::Logger::warn("Received message for disconnected client: " + connectionId_);
        return;
    }

    auto parsedMessage = MessageProtocol::parseMessage(message);
    if (!parsedMessage) {
        sendError("Unrecognized message", "Protocol");
        return;
    }

    switch (parsedMessage->getType()) {
        case MessageType::START_SESSION:
            processStartSession(static_cast<StartSessionMessage*>(parsedMessage.get()));
            break;
        case MessageType::STOP_SESSION:
            processStopSession();
            break;
        case MessageType::GET_STATE:
            processGetState();
            break;
        case MessageType::CANCEL_SESSION:
            processCancelSession();
            break;
        case MessageType::PING:
            processPing();
            break;
        default:
            utils::Logger::warn("Unexpected message type from client " + connectionId_);
            break;
    }
}

void ClientSession::handleBinaryMessage(std::string_view data) {
    if (!connected_) {
        utils::Logger::warn("Received binary data for disconnected client: " + connectionId_);
        return;
    }

    const std::string sessionId = getActiveSessionId();
    if (sessionId.empty()) {
        sendError("No active session, send start_session first", "SessionState");
        return;
    }

    try {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        orchestrator_.feedAudio(sessionId, bytes);
    } catch (const utils::PitchScribeException& e) {
        sendError(e);
    }
}

void ClientSession::disconnect() {
    if (!connected_.exchange(false)) {
        return;
    }

    const std::string sessionId = getActiveSessionId();
    if (sessionId.empty()) {
        return;
    }
    try {
        if (orchestrator_.cancelSession(sessionId)) {
            utils::Logger::info("Cancelled session " + sessionId + " after client " +
                                connectionId_ + " disconnected");
        }
    } catch (const utils::SessionNotFoundException& e) {
        utils::Logger::debug("Session already released: " + std::string(e.what()));
    }
}

void ClientSession::processStartSession(const StartSessionMessage* message) {
    try {
        std::string previous = getActiveSessionId();
        if (!previous.empty()) {
            auto state = orchestrator_.getSessionState(previous);
            if (!isTerminalStatus(state.status)) {
                sendError("Session " + previous + " is still " + statusToString(state.status),
                          "SessionState");
                return;
            }
            orchestrator_.releaseSession(previous);
        }

        auto config = message->buildConfiguration();
        std::string sessionId = orchestrator_.createSession(config);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            activeSessionId_ = sessionId;
        }
        sendMessage(SessionCreatedMessage(sessionId, config.toJson()));
    } catch (const utils::PitchScribeException& e) {
        sendError(e);
    }
}

void ClientSession::processStopSession() {
    const std::string sessionId = getActiveSessionId();
    if (sessionId.empty()) {
        sendError("No active session", "SessionState");
        return;
    }

    auto self = shared_from_this();
    auto work = [self, sessionId]() {
        try {
            auto outcome = self->orchestrator_.stopSession(sessionId);
            self->sendMessage(SessionResultMessage(outcome.toJson()));
        } catch (const utils::PitchScribeException& e) {
            self->sendError(e);
        } catch (const std::exception& e) {
            utils::Logger::error("Stop failed for session " + sessionId + ": " + e.what());
            self->sendError(e.what(), "System");
        }
    };

    if (dispatcher_) {
        dispatcher_(std::move(work));
    } else {
        work();
    }
}

void ClientSession::processGetState() {
    const std::string sessionId = getActiveSessionId();
    if (sessionId.empty()) {
        sendError("No active session", "SessionState");
        return;
    }

    try {
        auto snapshot = orchestrator_.getSessionState(sessionId);
        StatusUpdateMessage reply(sessionId, snapshot.status);
        reply.setSnapshot(snapshot.toJson());
        sendMessage(reply);
    } catch (const utils::PitchScribeException& e) {
        sendError(e);
    }
}

void ClientSession::processCancelSession() {
    const std::string sessionId = getActiveSessionId();
    if (sessionId.empty()) {
        sendError("No active session", "SessionState");
        return;
    }

    try {
        if (!orchestrator_.cancelSession(sessionId)) {
            sendError("Session already finished", "SessionState");
        }
    } catch (const utils::PitchScribeException& e) {
        sendError(e);
    }
}

void ClientSession::processPing() {
    sendMessage(PongMessage());
}

void ClientSession::onStatusChanged(const std::string& sessionId, SessionStatus previous,
                                    SessionStatus current) {
    if (!ownsSession(sessionId)) {
        return;
    }
    StatusUpdateMessage update(sessionId, current);
    update.setPreviousStatus(previous);
    sendMessage(update);
}

void ClientSession::onSegmentAdded(const std::string& sessionId, const stt::TranscriptSegment& segment) {
    if (!ownsSession(sessionId)) {
        return;
    }
    sendMessage(TranscriptSegmentMessage(sessionId, segment));
}

void ClientSession::onSessionError(const std::string& sessionId, const std::string& message) {
    if (!ownsSession(sessionId)) {
        return;
    }
    sendError(message, "SessionState");
}

void ClientSession::sendMessage(const Message& message) {
    if (!connected_ || !sender_) {
        utils::Logger::debug("Dropping message for disconnected client " + connectionId_);
        return;
    }
    sender_(message.serialize());
}

void ClientSession::sendError(const std::string& message, const std::string& code) {
    sendMessage(ErrorMessage(message, code));
}

void ClientSession::sendError(const std::exception& e) {
    std::string code = "Unknown";
    if (auto* pe = dynamic_cast<const utils::PitchScribeException*>(&e)) {
        code = utils::categoryToString(pe->category());
    }
    sendError(e.what(), code);
}

} // namespace core
} // namespace pitchscribe
