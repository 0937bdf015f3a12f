#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "audio/audio_configuration.hpp"
#include "core/session_events.hpp"
#include "stt/transcript.hpp"

namespace pitchscribe {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    START_SESSION,
    STOP_SESSION,
    GET_STATE,
    CANCEL_SESSION,
    PING,
    // Server to Client
    SESSION_CREATED,
    STATUS_UPDATE,
    TRANSCRIPT_SEGMENT,
    SESSION_RESULT,
    ERROR,
    PONG
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }
    virtual std::string serialize() const = 0;

protected:
    MessageType type_;
};

// Client to Server Messages
class StartSessionMessage : public Message {
public:
    StartSessionMessage() : Message(MessageType::START_SESSION) {}

    const std::string& getPreset() const { return preset_; }
    const nlohmann::json& getAudioConfig() const { return audioConfig_; }

    void setPreset(const std::string& preset) { preset_ = preset; }
    void setAudioConfig(const nlohmann::json& config) { audioConfig_ = config; }

    /**
     * Explicit audio_config wins over the preset; neither means the default profile.
     * @throws ConfigurationException for an unknown preset or invalid settings
     */
    audio::AudioConfiguration buildConfiguration() const;

    std::string serialize() const override;

private:
    std::string preset_;
    nlohmann::json audioConfig_;
};

class StopSessionMessage : public Message {
public:
    StopSessionMessage() : Message(MessageType::STOP_SESSION) {}
    std::string serialize() const override;
};

class GetStateMessage : public Message {
public:
    GetStateMessage() : Message(MessageType::GET_STATE) {}
    std::string serialize() const override;
};

class CancelSessionMessage : public Message {
public:
    CancelSessionMessage() : Message(MessageType::CANCEL_SESSION) {}
    std::string serialize() const override;
};

class PingMessage : public Message {
public:
    PingMessage() : Message(MessageType::PING) {}
    std::string serialize() const override;
};

// Server to Client Messages
class SessionCreatedMessage : public Message {
public:
    SessionCreatedMessage(const std::string& sessionId, const nlohmann::json& audioConfig)
        : Message(MessageType::SESSION_CREATED), sessionId_(sessionId), audioConfig_(audioConfig) {}

    const std::string& getSessionId() const { return sessionId_; }

    std::string serialize() const override;

private:
    std::string sessionId_;
    nlohmann::json audioConfig_;
};

class StatusUpdateMessage : public Message {
public:
    StatusUpdateMessage(const std::string& sessionId, SessionStatus status)
        : Message(MessageType::STATUS_UPDATE), sessionId_(sessionId), status_(status) {}

    const std::string& getSessionId() const { return sessionId_; }
    SessionStatus getStatus() const { return status_; }

    void setPreviousStatus(SessionStatus status) { previousStatus_ = status; }
    void setSnapshot(const nlohmann::json& snapshot) { snapshot_ = snapshot; }
    void setErrorMessage(const std::string& message) { errorMessage_ = message; }

    std::string serialize() const override;

private:
    std::string sessionId_;
    SessionStatus status_;
    std::optional<SessionStatus> previousStatus_;
    std::optional<nlohmann::json> snapshot_;
    std::string errorMessage_;
};

class TranscriptSegmentMessage : public Message {
public:
    TranscriptSegmentMessage(const std::string& sessionId, const stt::TranscriptSegment& segment)
        : Message(MessageType::TRANSCRIPT_SEGMENT), sessionId_(sessionId), segment_(segment) {}

    std::string serialize() const override;

private:
    std::string sessionId_;
    stt::TranscriptSegment segment_;
};

class SessionResultMessage : public Message {
public:
    explicit SessionResultMessage(const nlohmann::json& outcome)
        : Message(MessageType::SESSION_RESULT), outcome_(outcome) {}

    std::string serialize() const override;

private:
    nlohmann::json outcome_;
};

class ErrorMessage : public Message {
public:
    ErrorMessage(const std::string& message, const std::string& code = "")
        : Message(MessageType::ERROR), message_(message), code_(code) {}

    const std::string& getMessage() const { return message_; }
    const std::string& getCode() const { return code_; }

    std::string serialize() const override;

private:
    std::string message_;
    std::string code_;
};

class PongMessage : public Message {
public:
    PongMessage() : Message(MessageType::PONG) {}
    std::string serialize() const override;
};

// Message factory and parser
class MessageProtocol {
public:
    /**
     * Parse a client message. Returns nullptr for malformed JSON, a missing
     * type or a type clients may not send.
     */
    static std::unique_ptr<Message> parseMessage(const std::string& json);
    static MessageType getMessageType(const std::string& json);

    static std::string messageTypeToString(MessageType type);
    static MessageType stringToMessageType(const std::string& typeStr);
};

} // namespace core
} // namespace pitchscribe
