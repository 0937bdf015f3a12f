#include "core/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace pitchscribe {
namespace core {

namespace {

std::string envelope(MessageType type, const nlohmann::json& data = nlohmann::json()) {
    nlohmann::json root = {{"type", MessageProtocol::messageTypeToString(type)}};
    if (!data.is_null()) {
        root["data"] = data;
    }
    return root.dump();
}

} // namespace

// StartSessionMessage implementation
audio::AudioConfiguration StartSessionMessage::buildConfiguration() const {
    if (audioConfig_.is_object()) {
        return audio::AudioConfiguration::fromJson(audioConfig_);
    }
    if (preset_.empty() || preset_ == "default") {
        return audio::AudioConfiguration::createDefault();
    }
    if (preset_ == "pitch_analysis") {
        return audio::AudioConfiguration::createPitchAnalysis();
    }
    if (preset_ == "full_intelligence") {
        return audio::AudioConfiguration::createFullIntelligence();
    }
    throw utils::ConfigurationException("Unknown audio preset", preset_);
}

std::string StartSessionMessage::serialize() const {
    nlohmann::json data = nlohmann::json::object();
    if (!preset_.empty()) {
        data["preset"] = preset_;
    }
    if (audioConfig_.is_object()) {
        data["audio_config"] = audioConfig_;
    }
    return envelope(type_, data);
}

std::string StopSessionMessage::serialize() const {
    return envelope(type_);
}

std::string GetStateMessage::serialize() const {
    return envelope(type_);
}

std::string CancelSessionMessage::serialize() const {
    return envelope(type_);
}

std::string PingMessage::serialize() const {
    return envelope(type_);
}

// Server to client
std::string SessionCreatedMessage::serialize() const {
    return envelope(type_, {{"session_id", sessionId_}, {"audio_config", audioConfig_}});
}

std::string StatusUpdateMessage::serialize() const {
    nlohmann::json data = {
        {"session_id", sessionId_},
        {"status", statusToString(status_)}
    };
    if (previousStatus_) {
        data["previous_status"] = statusToString(*previousStatus_);
    }
    if (!errorMessage_.empty()) {
        data["error_message"] = errorMessage_;
    }
    if (snapshot_) {
        data["session"] = *snapshot_;
    }
    return envelope(type_, data);
}

std::string TranscriptSegmentMessage::serialize() const {
    return envelope(type_, {{"session_id", sessionId_}, {"segment", segment_.toJson()}});
}

std::string SessionResultMessage::serialize() const {
    return envelope(type_, outcome_);
}

std::string ErrorMessage::serialize() const {
    nlohmann::json data = {{"message", message_}};
    if (!code_.empty()) {
        data["code"] = code_;
    }
    return envelope(type_, data);
}

std::string PongMessage::serialize() const {
    return envelope(type_);
}

// MessageProtocol implementation
std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& json) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        utils::Logger::warn("Failed to parse client message: " + std::string(e.what()));
        return nullptr;
    }

    if (!root.is_object() || !root.contains("type") || !root.at("type").is_string()) {
        utils::Logger::warn("Invalid message format: missing type field");
        return nullptr;
    }

    const std::string typeStr = root.at("type").get<std::string>();
    const nlohmann::json data = root.contains("data") && root.at("data").is_object()
                                    ? root.at("data") : nlohmann::json::object();

    switch (stringToMessageType(typeStr)) {
        case MessageType::START_SESSION: {
            auto message = std::make_unique<StartSessionMessage>();
            if (data.contains("preset") && data.at("preset").is_string()) {
                message->setPreset(data.at("preset").get<std::string>());
            }
            if (data.contains("audio_config") && data.at("audio_config").is_object()) {
                message->setAudioConfig(data.at("audio_config"));
            }
            return message;
        }
        case MessageType::STOP_SESSION:
            return std::make_unique<StopSessionMessage>();
        case MessageType::GET_STATE:
            return std::make_unique<GetStateMessage>();
        case MessageType::CANCEL_SESSION:
            return std::make_unique<CancelSessionMessage>();
        case MessageType::PING:
            return std::make_unique<PingMessage>();
        default:
            utils::Logger::warn("Unsupported client message type: " + typeStr);
            return nullptr;
    }
}

MessageType MessageProtocol::getMessageType(const std::string& json) {
    auto root = nlohmann::json::parse(json, nullptr, false);
    if (root.is_discarded() || !root.is_object() || !root.contains("type") || !root.at("type").is_string()) {
        return MessageType::UNKNOWN;
    }
    return stringToMessageType(root.at("type").get<std::string>());
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "start_session") return MessageType::START_SESSION;
    if (typeStr == "stop_session") return MessageType::STOP_SESSION;
    if (typeStr == "get_state") return MessageType::GET_STATE;
    if (typeStr == "cancel_session") return MessageType::CANCEL_SESSION;
    if (typeStr == "ping") return MessageType::PING;
    if (typeStr == "session_created") return MessageType::SESSION_CREATED;
    if (typeStr == "status_update") return MessageType::STATUS_UPDATE;
    if (typeStr == "transcript_segment") return MessageType::TRANSCRIPT_SEGMENT;
    if (typeStr == "session_result") return MessageType::SESSION_RESULT;
    if (typeStr == "error") return MessageType::ERROR;
    if (typeStr == "pong") return MessageType::PONG;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::START_SESSION: return "start_session";
        case MessageType::STOP_SESSION: return "stop_session";
        case MessageType::GET_STATE: return "get_state";
        case MessageType::CANCEL_SESSION: return "cancel_session";
        case MessageType::PING: return "ping";
        case MessageType::SESSION_CREATED: return "session_created";
        case MessageType::STATUS_UPDATE: return "status_update";
        case MessageType::TRANSCRIPT_SEGMENT: return "transcript_segment";
        case MessageType::SESSION_RESULT: return "session_result";
        case MessageType::ERROR: return "error";
        case MessageType::PONG: return "pong";
        default: return "unknown";
    }
}

} // namespace core
} // namespace pitchscribe
