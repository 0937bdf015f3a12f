#include "core/session_events.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace pitchscribe {
namespace core {

std::string statusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::INITIALIZING: return "initializing";
        case SessionStatus::CONNECTED: return "connected";
        case SessionStatus::RECORDING: return "recording";
        case SessionStatus::STOPPING: return "stopping";
        case SessionStatus::STOPPED: return "stopped";
        case SessionStatus::ERROR: return "error";
    }
    return "error";
}

NotificationChannel::NotificationChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), dropped_(0), delivered_(0), observerFailures_(0) {
    dispatcher_ = std::thread(&NotificationChannel::dispatchLoop, this);
}

NotificationChannel::~NotificationChannel() {
    shutdown();
}

void NotificationChannel::subscribe(std::shared_ptr<SessionObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void NotificationChannel::unsubscribe(const std::shared_ptr<SessionObserver>& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void NotificationChannel::publish(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    condition_.notify_one();
}

bool NotificationChannel::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_for(lock, timeout, [this] { return queue_.empty() && !dispatching_; });
}

void NotificationChannel::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !dispatcher_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    condition_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

size_t NotificationChannel::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void NotificationChannel::dispatchLoop() {
    while (true) {
        SessionEvent event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // remaining events are still delivered on shutdown
            if (queue_.empty()) {
                drained_.notify_all();
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            dispatching_ = true;
        }

        deliver(event);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            dispatching_ = false;
            if (queue_.empty()) {
                drained_.notify_all();
            }
        }
    }
}

void NotificationChannel::deliver(const SessionEvent& event) {
    std::vector<std::shared_ptr<SessionObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            switch (event.type) {
                case SessionEvent::Type::STATUS_CHANGED:
                    observer->onStatusChanged(event.sessionId, event.previousStatus, event.status);
                    break;
                case SessionEvent::Type::SEGMENT_ADDED:
                    if (event.segment) {
                        observer->onSegmentAdded(event.sessionId, *event.segment);
                    }
                    break;
                case SessionEvent::Type::SESSION_ERROR:
                    observer->onSessionError(event.sessionId, event.errorMessage);
                    break;
            }
        } catch (const std::exception& e) {
            ++observerFailures_;
            utils::Logger::warn("Session observer failed for " + event.sessionId + ": " + e.what());
        }
    }
    ++delivered_;
}

} // namespace core
} // namespace pitchscribe
