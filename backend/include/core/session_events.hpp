#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace core {

enum class SessionStatus {
    INITIALIZING,
    CONNECTED,
    RECORDING,
    STOPPING,
    STOPPED,
    ERROR
};

std::string statusToString(SessionStatus status);

struct SessionEvent {
    enum class Type {
        STATUS_CHANGED,
        SEGMENT_ADDED,
        SESSION_ERROR
    };

    Type type;
    std::string sessionId;
    SessionStatus previousStatus = SessionStatus::INITIALIZING;
    SessionStatus status = SessionStatus::INITIALIZING;
    std::optional<stt::TranscriptSegment> segment;
    std::string errorMessage;
};

/**
 * Where sessions publish their events. publish must not throw or block.
 */
class SessionEventSink {
public:
    virtual ~SessionEventSink() = default;
    virtual void publish(SessionEvent event) = 0;
};

/**
 * Consumer of session events. Called from the notification dispatcher
 * thread, never from the thread mutating the session.
 */
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onStatusChanged(const std::string& sessionId, SessionStatus previous,
                                 SessionStatus current) = 0;
    virtual void onSegmentAdded(const std::string& sessionId, const stt::TranscriptSegment& segment) = 0;
    virtual void onSessionError(const std::string& sessionId, const std::string& message) = 0;
};

/**
 * Bounded event queue drained by one dispatcher thread. When full the oldest
 * event is dropped. Observer failures are logged and counted per observer.
 */
class NotificationChannel : public SessionEventSink {
public:
    explicit NotificationChannel(size_t capacity = 256);
    ~NotificationChannel() override;

    NotificationChannel(const NotificationChannel&) = delete;
    NotificationChannel& operator=(const NotificationChannel&) = delete;

    void subscribe(std::shared_ptr<SessionObserver> observer);
    void unsubscribe(const std::shared_ptr<SessionObserver>& observer);

    void publish(SessionEvent event) override;

    /**
     * Block until every queued event has been delivered or the timeout passes.
     * @return true if the queue drained
     */
    bool flush(std::chrono::milliseconds timeout);

    void shutdown();

    size_t capacity() const { return capacity_; }
    size_t pendingCount() const;
    size_t droppedCount() const { return dropped_.load(); }
    size_t deliveredCount() const { return delivered_.load(); }
    size_t observerFailureCount() const { return observerFailures_.load(); }

private:
    void dispatchLoop();
    void deliver(const SessionEvent& event);

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable drained_;
    std::deque<SessionEvent> queue_;
    std::vector<std::shared_ptr<SessionObserver>> observers_;
    bool dispatching_ = false;
    bool stopping_ = false;
    std::atomic<size_t> dropped_;
    std::atomic<size_t> delivered_;
    std::atomic<size_t> observerFailures_;
    std::thread dispatcher_;
};

} // namespace core
} // namespace pitchscribe
