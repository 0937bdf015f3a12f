#include "stt/provider_messages.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace pitchscribe {
namespace stt {

namespace {

constexpr std::array<const char*, 7> kFeatureAnnotationTypes = {
    "sentiment_analysis",
    "emotion_analysis",
    "named_entity_recognition",
    "post_summarization",
    "post_chapterization",
    "speaker_identification",
    "translation"
};

ProviderMessage parseTranscript(const nlohmann::json& root) {
    if (!root.contains("data") || !root.at("data").is_object()) {
        throw utils::ProtocolException("Transcript message without data object");
    }
    const auto& data = root.at("data");
    if (!data.contains("utterance") || !data.at("utterance").is_object()) {
        throw utils::ProtocolException("Transcript message without utterance");
    }
    const auto& utterance = data.at("utterance");

    std::string text = utterance.value("text", std::string());
    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return UnknownEvent{"transcript"};
    }

    std::optional<int> channel;
    std::optional<double> confidence;
    if (utterance.contains("channel") && !utterance.at("channel").is_null()) {
        channel = utterance.at("channel").get<int>();
    }
    if (utterance.contains("confidence") && !utterance.at("confidence").is_null()) {
        confidence = utterance.at("confidence").get<double>();
    }

    std::string id;
    if (data.contains("id")) {
        id = data.at("id").is_string() ? data.at("id").get<std::string>() : data.at("id").dump();
    }

    return TranscriptEvent{TranscriptSegment(id, text,
                                             utterance.value("start", 0.0),
                                             utterance.value("end", 0.0),
                                             utterance.value("language", std::string("en")),
                                             channel, confidence,
                                             data.value("is_final", false))};
}

} // namespace

bool isFeatureAnnotationType(const std::string& type) {
    return std::find(kFeatureAnnotationTypes.begin(), kFeatureAnnotationTypes.end(), type) !=
           kFeatureAnnotationTypes.end();
}

ProviderMessage parseProviderMessage(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw utils::ProtocolException("Malformed provider message", e.what());
    }

    if (!root.is_object() || !root.contains("type") || !root.at("type").is_string()) {
        throw utils::ProtocolException("Provider message without type tag");
    }
    const std::string type = root.at("type").get<std::string>();

    try {
        if (type == "transcript") {
            return parseTranscript(root);
        }
        if (type == "session_ends" || type == "end_session") {
            return SessionEndsEvent{};
        }
        if (type == "error") {
            std::string message = "Provider error";
            if (root.contains("data") && root.at("data").is_object()) {
                message = root.at("data").value("message", message);
            } else if (root.contains("message") && root.at("message").is_string()) {
                message = root.at("message").get<std::string>();
            }
            return ProviderErrorEvent{message};
        }
        if (isFeatureAnnotationType(type)) {
            return FeatureAnnotationEvent{type, root.value("data", nlohmann::json::object())};
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::ProtocolException("Malformed " + type + " message", e.what());
    }

    return UnknownEvent{type};
}

std::string stopRecordingMessage() {
    return nlohmann::json{{"type", "stop_recording"}}.dump();
}

} // namespace stt
} // namespace pitchscribe
