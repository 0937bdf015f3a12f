#include <gtest/gtest.h>
#include "core/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"

using namespace pitchscribe::core;
using pitchscribe::audio::AudioConfiguration;
using pitchscribe::utils::ConfigurationException;

class MessageProtocolTest : public ::testing::Test {};

TEST_F(MessageProtocolTest, ParsesClientMessages) {
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"stop_session"})")->getType(), MessageType::STOP_SESSION);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"get_state"})")->getType(), MessageType::GET_STATE);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"cancel_session"})")->getType(), MessageType::CANCEL_SESSION);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"ping","data":{}})")->getType(), MessageType::PING);
}

TEST_F(MessageProtocolTest, StartSessionWithPreset) {
    auto message = MessageProtocol::parseMessage(R"({"type":"start_session","data":{"preset":"full_intelligence"}})");
    ASSERT_NE(message, nullptr);
    ASSERT_EQ(message->getType(), MessageType::START_SESSION);

    auto* start = static_cast<StartSessionMessage*>(message.get());
    EXPECT_EQ(start->getPreset(), "full_intelligence");
    EXPECT_EQ(start->buildConfiguration(), AudioConfiguration::createFullIntelligence());
}

TEST_F(MessageProtocolTest, StartSessionAudioConfigWinsOverPreset) {
    auto message = MessageProtocol::parseMessage(
        R"({"type":"start_session","data":{"preset":"pitch_analysis","audio_config":{"sample_rate":48000,"channels":2}}})");
    auto* start = static_cast<StartSessionMessage*>(message.get());

    auto config = start->buildConfiguration();
    EXPECT_EQ(config.getSampleRate(), 48000u);
    EXPECT_EQ(config.getChannels(), 2);
    EXPECT_FALSE(config.requiresBatchForFullFidelity());
}

TEST_F(MessageProtocolTest, StartSessionDefaultsAndErrors) {
    StartSessionMessage empty;
    EXPECT_EQ(empty.buildConfiguration(), AudioConfiguration::createDefault());

    StartSessionMessage unknown;
    unknown.setPreset("karaoke");
    EXPECT_THROW(unknown.buildConfiguration(), ConfigurationException);

    StartSessionMessage invalid;
    invalid.setAudioConfig({{"bit_depth", 7}});
    EXPECT_THROW(invalid.buildConfiguration(), ConfigurationException);
}

TEST_F(MessageProtocolTest, RejectsInvalidOrServerMessages) {
    EXPECT_EQ(MessageProtocol::parseMessage("not json"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"data":{}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":42})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"session_result"})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"dance"})"), nullptr);

    EXPECT_EQ(MessageProtocol::getMessageType("{oops"), MessageType::UNKNOWN);
    EXPECT_EQ(MessageProtocol::getMessageType(R"({"type":"pong"})"), MessageType::PONG);
}

TEST_F(MessageProtocolTest, TypeNamesRoundTrip) {
    for (auto type : {MessageType::START_SESSION, MessageType::STOP_SESSION, MessageType::GET_STATE,
                      MessageType::CANCEL_SESSION, MessageType::PING, MessageType::SESSION_CREATED,
                      MessageType::STATUS_UPDATE, MessageType::TRANSCRIPT_SEGMENT,
                      MessageType::SESSION_RESULT, MessageType::ERROR, MessageType::PONG}) {
        EXPECT_EQ(MessageProtocol::stringToMessageType(MessageProtocol::messageTypeToString(type)), type);
    }
    EXPECT_EQ(MessageProtocol::messageTypeToString(MessageType::UNKNOWN), "unknown");
}

TEST_F(MessageProtocolTest, ServerMessageEnvelopes) {
    auto created = nlohmann::json::parse(SessionCreatedMessage("sess_1", {{"channels", 1}}).serialize());
    EXPECT_EQ(created.at("type"), "session_created");
    EXPECT_EQ(created.at("data").at("session_id"), "sess_1");

    StatusUpdateMessage update("sess_1", SessionStatus::STOPPED);
    update.setPreviousStatus(SessionStatus::STOPPING);
    update.setSnapshot({{"segment_count", 2}});
    auto status = nlohmann::json::parse(update.serialize());
    EXPECT_EQ(status.at("data").at("status"), "stopped");
    EXPECT_EQ(status.at("data").at("previous_status"), "stopping");
    EXPECT_EQ(status.at("data").at("session").at("segment_count"), 2);
    EXPECT_FALSE(status.at("data").contains("error_message"));

    auto segment = nlohmann::json::parse(
        TranscriptSegmentMessage("sess_1", fixtures::makeSegment("u1", "hello", 0.0, 1.0)).serialize());
    EXPECT_EQ(segment.at("data").at("segment").at("text"), "hello");

    auto error = nlohmann::json::parse(ErrorMessage("No active session", "SessionState").serialize());
    EXPECT_EQ(error.at("type"), "error");
    EXPECT_EQ(error.at("data").at("code"), "SessionState");

    auto pong = nlohmann::json::parse(PongMessage().serialize());
    EXPECT_EQ(pong.at("type"), "pong");
    EXPECT_FALSE(pong.contains("data"));
}
