#include "core/session_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace pitchscribe {
namespace core {

void SessionRegistry::add(std::shared_ptr<SessionRecord> record) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& id = record->session->getId();
    if (records_.count(id) > 0) {
        throw utils::ConfigurationException("Duplicate session id", id);
    }
    records_.emplace(id, std::move(record));
}

std::shared_ptr<SessionRecord> SessionRegistry::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(sessionId);
    return it == records_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionRecord> SessionRegistry::get(const std::string& sessionId) const {
    auto record = find(sessionId);
    if (!record) {
        throw utils::SessionNotFoundException(sessionId);
    }
    return record;
}

bool SessionRegistry::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(sessionId) > 0;
}

size_t SessionRegistry::purgeTerminal(std::chrono::milliseconds maxAge) {
    auto cutoff = AudioSession::Clock::now() - maxAge;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& session = it->second->session;
        if (session->isTerminal() && session->getUpdatedAt() <= cutoff &&
            !it->second->stopInProgress.load()) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        utils::Logger::info("Purged " + std::to_string(removed) + " finished sessions");
    }
    return removed;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t SessionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : records_) {
        if (!entry.second->session->isTerminal()) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(records_.size());
    for (const auto& entry : records_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace core
} // namespace pitchscribe
