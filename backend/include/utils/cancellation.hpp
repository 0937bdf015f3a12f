#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace pitchscribe {
namespace utils {

/**
 * Cooperative cancellation flag shared between a session's driver and its
 * transcription paths. sleepFor wakes early on cancel.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    /**
     * Sleep for the given duration unless cancelled first.
     * @return false if cancelled
     */
    bool sleepFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_;
    std::mutex mutex_;
    std::condition_variable condition_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace utils
} // namespace pitchscribe
