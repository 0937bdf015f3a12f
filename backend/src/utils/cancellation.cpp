#include "utils/cancellation.hpp"

namespace pitchscribe {
namespace utils {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return !cancelled_.load();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return !condition_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

} // namespace utils
} // namespace pitchscribe
