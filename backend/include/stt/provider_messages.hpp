#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace stt {

// Realtime messages from the transcription provider, parsed once at the socket boundary

struct TranscriptEvent {
    TranscriptSegment segment;
};

struct SessionEndsEvent {
};

struct ProviderErrorEvent {
    std::string message;
};

struct FeatureAnnotationEvent {
    std::string type;
    nlohmann::json data;
};

struct UnknownEvent {
    std::string type;
};

using ProviderMessage = std::variant<TranscriptEvent, SessionEndsEvent, ProviderErrorEvent,
                                     FeatureAnnotationEvent, UnknownEvent>;

/**
 * Classify one text frame from the realtime connection.
 *
 * A transcript with blank text is reported as UnknownEvent("transcript")
 * since there is nothing to record.
 *
 * @throws ProtocolException on malformed JSON, a missing type tag or a
 *         transcript payload that does not describe a valid segment
 */
ProviderMessage parseProviderMessage(const std::string& text);

bool isFeatureAnnotationType(const std::string& type);

std::string stopRecordingMessage();

} // namespace stt
} // namespace pitchscribe
