#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "core/session_events.hpp"

namespace pitchscribe {
namespace core {

class SessionOrchestrator;
class Message;
class StartSessionMessage;

/**
 * One connected recording client. Owns at most one orchestrator session at a
 * time and forwards that session's events back to the client.
 */
class ClientSession : public SessionObserver,
                      public std::enable_shared_from_this<ClientSession> {
public:
    // Must be safe to call from any thread
    using SendFunction = std::function<void(const std::string&)>;
    // Runs blocking work off the network thread
    using WorkDispatcher = std::function<void(std::function<void()>)>;

    ClientSession(const std::string& connectionId, SessionOrchestrator& orchestrator);
    ~ClientSession() override = default;

    void setSender(SendFunction sender) { sender_ = std::move(sender); }
    void setDispatcher(WorkDispatcher dispatcher) { dispatcher_ = std::move(dispatcher); }

    const std::string& getConnectionId() const { return connectionId_; }
    bool isConnected() const { return connected_; }
    std::string getActiveSessionId() const;

    // Message handling
    void handleMessage(const std::string& message);
    void handleBinaryMessage(std::string_view data);

    /**
     * Client went away. An unfinished session is cancelled.
     */
    void disconnect();

    // SessionObserver
    void onStatusChanged(const std::string& sessionId, SessionStatus previous,
                         SessionStatus current) override;
    void onSegmentAdded(const std::string& sessionId, const stt::TranscriptSegment& segment) override;
    void onSessionError(const std::string& sessionId, const std::string& message) override;

private:
    void processStartSession(const StartSessionMessage* message);
    void processStopSession();
    void processGetState();
    void processCancelSession();
    void processPing();

    void sendMessage(const Message& message);
    void sendError(const std::string& message, const std::string& code);
    void sendError(const std::exception& e);
    bool ownsSession(const std::string& sessionId) const;

    std::string connectionId_;
    SessionOrchestrator& orchestrator_;
    std::atomic<bool> connected_;

    SendFunction sender_;
    WorkDispatcher dispatcher_;

    mutable std::mutex mutex_;
    std::string activeSessionId_;
};

} // namespace core
} // namespace pitchscribe
