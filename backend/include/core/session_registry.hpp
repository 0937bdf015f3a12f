#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/audio_session.hpp"
#include "utils/cancellation.hpp"

namespace pitchscribe {
namespace core {

/**
 * Everything the orchestrator keeps per session.
 */
struct SessionRecord {
    explicit SessionRecord(std::shared_ptr<AudioSession> s)
        : session(std::move(s)), cancellation(std::make_shared<utils::CancellationToken>()) {}

    std::shared_ptr<AudioSession> session;
    utils::CancellationTokenPtr cancellation;

    // guards audioBuffer, setting stopInProgress and the feed/stop/cancel status checks
    std::mutex audioMutex;
    std::vector<uint8_t> audioBuffer;

    std::atomic<bool> stopInProgress{false};
};

/**
 * Sessions owned by one orchestrator instance.
 */
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @throws ConfigurationException if the id is already registered
     */
    void add(std::shared_ptr<SessionRecord> record);

    // nullptr when unknown
    std::shared_ptr<SessionRecord> find(const std::string& sessionId) const;

    /**
     * @throws SessionNotFoundException when unknown
     */
    std::shared_ptr<SessionRecord> get(const std::string& sessionId) const;

    bool remove(const std::string& sessionId);

    /**
     * Drop terminal sessions last updated more than maxAge ago.
     * @return number of sessions removed
     */
    size_t purgeTerminal(std::chrono::milliseconds maxAge);

    size_t size() const;
    size_t activeCount() const;
    std::vector<std::string> ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionRecord>> records_;
};

} // namespace core
} // namespace pitchscribe
