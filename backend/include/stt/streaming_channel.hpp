#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "stt/realtime_connection.hpp"
#include "stt/transcript.hpp"
#include "utils/cancellation.hpp"
#include "utils/config.hpp"

namespace pitchscribe {
namespace stt {

enum class StreamStopReason {
    SESSION_ENDED,
    PROVIDER_ERROR,
    MESSAGE_LIMIT,
    TIMEOUT_LIMIT,
    DISCONNECTED,
    CANCELLED
};

std::string stopReasonToString(StreamStopReason reason);

struct StreamingResult {
    std::vector<TranscriptSegment> segments;   // arrival order
    StreamStopReason stopReason = StreamStopReason::SESSION_ENDED;
    std::string errorMessage;
    size_t chunksSent = 0;
    size_t messagesReceived = 0;
    size_t annotationMessages = 0;
    size_t malformedMessages = 0;
    size_t unknownMessages = 0;

    // provider error or dropped connection
    bool endedWithError() const {
        return stopReason == StreamStopReason::PROVIDER_ERROR ||
               stopReason == StreamStopReason::DISCONNECTED;
    }
};

/**
 * Realtime transcription path. Streams a recording to the provider in paced
 * chunks, sends the stop control message and collects transcript messages
 * in a bounded receive loop.
 */
class StreamingTranscriptionChannel {
public:
    using SegmentCallback = std::function<void(const TranscriptSegment&)>;

    StreamingTranscriptionChannel(RealtimeConnector& connector, utils::StreamingSettings settings);

    /**
     * @param url realtime endpoint of the bound provider session
     * @param onSegment invoked for every accepted segment, in arrival order
     * @throws ConnectionException or TimeoutException if the connection cannot be
     *         opened, ConnectionException if sending audio fails
     */
    StreamingResult run(const std::string& url,
                        const std::vector<uint8_t>& audio,
                        utils::CancellationToken& token,
                        const std::string& sessionId = "",
                        const SegmentCallback& onSegment = nullptr);

    const utils::StreamingSettings& settings() const { return settings_; }

private:
    bool sendAudio(RealtimeConnection& connection, const std::vector<uint8_t>& audio,
                   utils::CancellationToken& token, StreamingResult& result);

    /**
     * Wait for the next message for at most one read timeout, slicing the wait
     * so cancellation is observed promptly.
     */
    ReceiveResult receiveOne(RealtimeConnection& connection, utils::CancellationToken& token);

    RealtimeConnector& connector_;
    utils::StreamingSettings settings_;
};

} // namespace stt
} // namespace pitchscribe
