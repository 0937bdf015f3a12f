#include "stt/streaming_channel.hpp"
#include "stt/provider_messages.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <optional>

namespace pitchscribe {
namespace stt {

namespace {

constexpr std::chrono::milliseconds kCancelCheckSlice{100};

/**
 * Closes the realtime connection on every exit path.
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(RealtimeConnection& connection) : connection_(connection) {}
    ~ConnectionGuard() {
        try {
            connection_.close();
        } catch (const std::exception& e) {
            utils::Logger::warn("Failed to close realtime connection: " + std::string(e.what()));
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    RealtimeConnection& connection_;
};

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string stopReasonToString(StreamStopReason reason) {
    switch (reason) {
        case StreamStopReason::SESSION_ENDED: return "session_ended";
        case StreamStopReason::PROVIDER_ERROR: return "provider_error";
        case StreamStopReason::MESSAGE_LIMIT: return "message_limit";
        case StreamStopReason::TIMEOUT_LIMIT: return "timeout_limit";
        case StreamStopReason::DISCONNECTED: return "disconnected";
        case StreamStopReason::CANCELLED: return "cancelled";
    }
    return "unknown";
}

StreamingTranscriptionChannel::StreamingTranscriptionChannel(RealtimeConnector& connector,
                                                             utils::StreamingSettings settings)
    : connector_(connector), settings_(settings) {
    if (settings_.chunkBytes == 0) {
        settings_.chunkBytes = 4096;
    }
}

StreamingResult StreamingTranscriptionChannel::run(const std::string& url,
                                                   const std::vector<uint8_t>& audio,
                                                   utils::CancellationToken& token,
                                                   const std::string& sessionId,
                                                   const SegmentCallback& onSegment) {
    utils::ErrorContext context("StreamingTranscription", sessionId);
    StreamingResult result;

    if (token.isCancelled()) {
        result.stopReason = StreamStopReason::CANCELLED;
        return result;
    }

    auto connection = connector_.connect(url, settings_.connectTimeout);
    ConnectionGuard guard(*connection);
    utils::Logger::info("Streaming " + std::to_string(audio.size()) +
                        " bytes for session " + sessionId);

    if (!sendAudio(*connection, audio, token, result)) {
        result.stopReason = StreamStopReason::CANCELLED;
        utils::Logger::info("Streaming cancelled while sending audio for session " + sessionId);
        return result;
    }
    connection->sendText(stopRecordingMessage());

    size_t consecutiveTimeouts = 0;
    while (true) {
        if (token.isCancelled()) {
            result.stopReason = StreamStopReason::CANCELLED;
            break;
        }
        if (result.messagesReceived >= settings_.maxMessages) {
            result.stopReason = StreamStopReason::MESSAGE_LIMIT;
            break;
        }
        if (consecutiveTimeouts >= settings_.maxConsecutiveTimeouts) {
            result.stopReason = StreamStopReason::TIMEOUT_LIMIT;
            break;
        }

        ReceiveResult received = receiveOne(*connection, token);
        if (received.status == ReceiveResult::Status::TIMEOUT) {
            if (token.isCancelled()) {
                continue;
            }
            ++consecutiveTimeouts;
            utils::Logger::debug("Realtime read timeout " + std::to_string(consecutiveTimeouts) +
                                 " for session " + sessionId);
            continue;
        }
        if (received.status == ReceiveResult::Status::CLOSED) {
            result.stopReason = StreamStopReason::DISCONNECTED;
            result.errorMessage = "Provider connection closed: " + received.error;
            utils::Logger::warn(result.errorMessage + " (session " + sessionId + ", " +
                                std::to_string(result.segments.size()) + " segments kept)");
            break;
        }

        consecutiveTimeouts = 0;
        ++result.messagesReceived;

        std::optional<ProviderMessage> message;
        try {
            message = parseProviderMessage(received.text);
        } catch (const utils::ProtocolException& e) {
            ++result.malformedMessages;
            utils::ErrorHandler::getInstance().reportError(e, "StreamingTranscription", sessionId);
            continue;
        }

        bool finished = std::visit(overloaded{
            [&](const TranscriptEvent& event) {
                result.segments.push_back(event.segment);
                if (onSegment) {
                    onSegment(event.segment);
                }
                return false;
            },
            [&](const SessionEndsEvent&) {
                result.stopReason = StreamStopReason::SESSION_ENDED;
                return true;
            },
            [&](const ProviderErrorEvent& event) {
                result.stopReason = StreamStopReason::PROVIDER_ERROR;
                result.errorMessage = event.message;
                utils::Logger::error("Provider error for session " + sessionId + ": " + event.message);
                return true;
            },
            [&](const FeatureAnnotationEvent& event) {
                ++result.annotationMessages;
                utils::Logger::debug("Realtime " + event.type + " annotation for session " + sessionId);
                return false;
            },
            [&](const UnknownEvent& event) {
                ++result.unknownMessages;
                utils::Logger::debug("Ignoring provider message of type " + event.type);
                return false;
            }
        }, *message);

        if (finished) {
            break;
        }
    }

    utils::Logger::info("Streaming finished for session " + sessionId + ": " +
                        stopReasonToString(result.stopReason) + ", " +
                        std::to_string(result.segments.size()) + " segments from " +
                        std::to_string(result.messagesReceived) + " messages");
    return result;
}

bool StreamingTranscriptionChannel::sendAudio(RealtimeConnection& connection,
                                              const std::vector<uint8_t>& audio,
                                              utils::CancellationToken& token,
                                              StreamingResult& result) {
    size_t offset = 0;
    while (offset < audio.size()) {
        if (token.isCancelled()) {
            return false;
        }
        size_t length = std::min(settings_.chunkBytes, audio.size() - offset);
        connection.sendBinary(audio.data() + offset, length);
        offset += length;
        ++result.chunksSent;

        if (offset < audio.size() && !token.sleepFor(settings_.chunkInterval)) {
            return false;
        }
    }
    return !token.isCancelled();
}

ReceiveResult StreamingTranscriptionChannel::receiveOne(RealtimeConnection& connection,
                                                        utils::CancellationToken& token) {
    auto remaining = settings_.readTimeout;
    while (true) {
        auto slice = std::min(remaining, kCancelCheckSlice);
        ReceiveResult received = connection.receive(slice);
        if (received.status != ReceiveResult::Status::TIMEOUT) {
            return received;
        }
        remaining -= slice;
        if (remaining.count() <= 0 || token.isCancelled()) {
            return received;
        }
    }
}

} // namespace stt
} // namespace pitchscribe
