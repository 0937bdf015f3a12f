#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <future>
#include <regex>
#include <thread>
#include "core/session_orchestrator.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/mock_provider.hpp"
#include "../fixtures/test_data_generator.hpp"

using namespace pitchscribe;
using namespace pitchscribe::core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class SessionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.streaming().chunkBytes = 1024;
        config.streaming().chunkInterval = std::chrono::milliseconds(0);
        config.streaming().readTimeout = std::chrono::milliseconds(10);
        config.streaming().maxConsecutiveTimeouts = 10;
        config.batch().pollInterval = std::chrono::milliseconds(0);
        config.batch().maxPollAttempts = 3;

        scoring = std::make_shared<NiceMock<fixtures::MockScoringCollaborator>>();
        ON_CALL(provider, createLiveSession(_))
            .WillByDefault(Return(stt::LiveSessionInfo{"live-1", "wss://provider/live-1"}));
    }

    void TearDown() override {
        if (orchestrator) {
            orchestrator->shutdown();
        }
    }

    SessionOrchestrator& build() {
        orchestrator = std::make_unique<SessionOrchestrator>(config, connector, provider, scoring);
        return *orchestrator;
    }

    void expectBatchJob(const nlohmann::json& finalJob) {
        EXPECT_CALL(provider, uploadAudio(_, _)).WillOnce(Return("https://upload/audio-1"));
        EXPECT_CALL(provider, submitTranscription("https://upload/audio-1", _))
            .WillOnce(Return(stt::SubmittedJob{"job-1", "https://api/v2/pre-recorded/job-1"}));
        EXPECT_CALL(provider, fetchJob(_)).WillRepeatedly(Return(fixtures::jobStatus(finalJob)));
    }

    std::string startWithAudio(const audio::AudioConfiguration& audioConfig, size_t bytes = 4096) {
        auto id = orchestrator->createSession(audioConfig);
        orchestrator->feedAudio(id, fixtures::silence(bytes));
        return id;
    }

    utils::Config config = utils::Config::defaults();
    fixtures::FakeRealtimeConnector connector;
    NiceMock<fixtures::MockProviderClient> provider;
    std::shared_ptr<NiceMock<fixtures::MockScoringCollaborator>> scoring;
    std::unique_ptr<SessionOrchestrator> orchestrator;
};

TEST_F(SessionOrchestratorTest, CreateBindsProviderSession) {
    auto& orch = build();
    auto id = orch.createSession(audio::AudioConfiguration::createDefault());

    EXPECT_TRUE(std::regex_match(id, std::regex("sess_[0-9a-f]{16}")));
    auto state = orch.getSessionState(id);
    EXPECT_EQ(state.status, SessionStatus::CONNECTED);
    ASSERT_TRUE(state.binding.has_value());
    EXPECT_EQ(state.binding->providerSessionId, "live-1");
    EXPECT_EQ(orch.activeSessionCount(), 1u);
    EXPECT_NE(orch.createSession(audio::AudioConfiguration::createDefault()), id);
}

TEST_F(SessionOrchestratorTest, StreamingTranscriptIsAnalysedAndHandedOff) {
    connector.script->pushMessage(fixtures::transcriptMessage("u1", "we cut onboarding", 0.0, 1.5, false));
    connector.script->pushMessage(fixtures::transcriptMessage("u2", "we cut onboarding time in half", 0.0, 2.5));
    connector.script->pushMessage(fixtures::sessionEndsMessage());
    EXPECT_CALL(provider, uploadAudio(_, _)).Times(0);
    EXPECT_CALL(*scoring, handoff(_, _, _)).Times(1);

    auto& orch = build();
    auto observer = std::make_shared<fixtures::RecordingObserver>();
    orch.subscribe(observer);

    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis(), 3000);
    EXPECT_EQ(orch.getSessionState(id).status, SessionStatus::RECORDING);

    auto outcome = orch.stopSession(id);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_FALSE(outcome.usedBatch);
    EXPECT_EQ(outcome.streamingStopReason, stt::StreamStopReason::SESSION_ENDED);
    EXPECT_EQ(outcome.transcript.segmentCount(), 2u);
    ASSERT_TRUE(outcome.report.has_value());
    // interim result is excluded from analysis
    EXPECT_EQ(outcome.report->speech.totalWords, 6u);
    EXPECT_EQ(connector.script->bytesSent, 3000u);
    EXPECT_EQ(connector.lastUrl, "wss://provider/live-1");

    auto j = outcome.toJson();
    EXPECT_EQ(j.at("session").at("status"), "stopped");
    EXPECT_EQ(j.at("streaming_stop_reason"), "session_ended");
    EXPECT_FALSE(j.at("intelligence").is_null());

    orch.shutdown();
    ASSERT_TRUE(orch.notifications().flush(std::chrono::seconds(2)));
    std::vector<SessionStatus> statuses;
    for (const auto& entry : observer->statuses) {
        statuses.push_back(entry.second);
    }
    EXPECT_EQ(statuses, (std::vector<SessionStatus>{SessionStatus::CONNECTED, SessionStatus::RECORDING,
                                                    SessionStatus::STOPPING, SessionStatus::STOPPED}));
    EXPECT_EQ(observer->segmentIds, (std::vector<std::string>{"u1", "u2"}));
}

TEST_F(SessionOrchestratorTest, SilentStreamFallsBackToBatchOnce) {
    auto done = fixtures::finishedJob({{"Our platform saves teams ten hours a week", 0.0, 3.0, 0.93, 0}});
    done["result"]["sentiment_analysis"] = {{"success", true}, {"results", {
        {{"sentiment", "positive"}, {"text", "saves teams"}, {"start", 0.0}, {"end", 3.0}}
    }}};
    expectBatchJob(done);
    EXPECT_CALL(provider, deleteJob("job-1")).Times(1);
    EXPECT_CALL(*scoring, handoff(_, _, _)).Times(1);

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis());
    auto outcome = orch.stopSession(id);

    EXPECT_EQ(outcome.streamingStopReason, stt::StreamStopReason::TIMEOUT_LIMIT);
    EXPECT_EQ(connector.script->receiveCalls, 10u);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.usedBatch);
    ASSERT_EQ(outcome.transcript.segmentCount(), 1u);
    EXPECT_EQ(outcome.transcript.getSegments()[0].getId(), "batch_0");
    ASSERT_TRUE(outcome.report.has_value());
    ASSERT_TRUE(outcome.report->annotations.has_value());
    EXPECT_EQ(outcome.report->annotations->dominantSentiment(), "positive");
    EXPECT_TRUE(outcome.report->confidence.fromProvider);
}

TEST_F(SessionOrchestratorTest, BatchTimeoutKeepsStreamingSegments) {
    connector.script->pushMessage(fixtures::transcriptMessage("u1", "first half of the pitch", 0.0, 2.0));
    connector.script->pushClosed("connection reset");
    config.batch().maxPollAttempts = 2;
    EXPECT_CALL(provider, uploadAudio(_, _)).WillOnce(Return("https://upload/audio-1"));
    EXPECT_CALL(provider, submitTranscription(_, _))
        .WillOnce(Return(stt::SubmittedJob{"job-1", "https://api/v2/pre-recorded/job-1"}));
    EXPECT_CALL(provider, fetchJob(_)).Times(2).WillRepeatedly(Return(fixtures::jobStatus(fixtures::pendingJob())));

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis());
    auto outcome = orch.stopSession(id);

    EXPECT_EQ(outcome.snapshot.status, SessionStatus::STOPPED);
    EXPECT_EQ(outcome.streamingStopReason, stt::StreamStopReason::DISCONNECTED);
    EXPECT_FALSE(outcome.usedBatch);
    ASSERT_EQ(outcome.transcript.segmentCount(), 1u);
    EXPECT_EQ(outcome.transcript.getSegments()[0].getId(), "u1");
    EXPECT_TRUE(outcome.report.has_value());
    EXPECT_GE(outcome.warnings.size(), 2u);
}

TEST_F(SessionOrchestratorTest, BatchReplacesPartialStreamingTranscript) {
    connector.script->pushMessage(fixtures::transcriptMessage("u1", "partial", 0.0, 1.0));
    connector.script->pushMessage(fixtures::providerErrorMessage("internal error"));
    expectBatchJob(fixtures::finishedJob({{"the complete opening line", 0.0, 2.0, std::nullopt, std::nullopt},
                                          {"and the close", 2.5, 4.0, std::nullopt, std::nullopt}}));

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createFullIntelligence());
    auto outcome = orch.stopSession(id);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.usedBatch);
    EXPECT_EQ(outcome.streamingStopReason, stt::StreamStopReason::PROVIDER_ERROR);
    EXPECT_EQ(outcome.transcript.fullText(), "the complete opening line and the close");
    EXPECT_EQ(orch.getSessionState(id).transcript.segmentCount(), 2u);
}

TEST_F(SessionOrchestratorTest, RealtimeOnlyConfigNeverUsesBatch) {
    EXPECT_CALL(provider, uploadAudio(_, _)).Times(0);

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());
    auto outcome = orch.stopSession(id);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.transcript.isEmpty());
    EXPECT_TRUE(outcome.report.has_value());
}

TEST_F(SessionOrchestratorTest, EveryPathFailingEndsInError) {
    connector.script->pushMessage(fixtures::providerErrorMessage("unsupported audio"));
    EXPECT_CALL(provider, uploadAudio(_, _)).WillOnce(Throw(utils::ConnectionException("HTTP 503", "upload")));
    EXPECT_CALL(*scoring, handoff(_, _, _)).Times(0);

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis());
    auto outcome = orch.stopSession(id);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.snapshot.status, SessionStatus::ERROR);
    EXPECT_FALSE(outcome.report.has_value());
    ASSERT_TRUE(outcome.snapshot.errorMessage.has_value());
    EXPECT_NE(outcome.snapshot.errorMessage->find("HTTP 503"), std::string::npos);
}

TEST_F(SessionOrchestratorTest, OversizedAudioSkipsBatch) {
    config.batch().maxUploadBytes = 1000;
    EXPECT_CALL(provider, uploadAudio(_, _)).Times(0);

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis(), 2000);
    auto outcome = orch.stopSession(id);

    // streaming finished cleanly, so an empty transcript is not an error
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_FALSE(outcome.usedBatch);
    EXPECT_FALSE(outcome.warnings.empty());
}

TEST_F(SessionOrchestratorTest, StopWithoutAudio) {
    auto& orch = build();
    auto id = orch.createSession(audio::AudioConfiguration::createPitchAnalysis());
    auto outcome = orch.stopSession(id);

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.warnings, std::vector<std::string>{"No audio received"});
    EXPECT_EQ(connector.connectCount, 0u);
}

TEST_F(SessionOrchestratorTest, FinalAudioReplacesBuffer) {
    connector.script->pushMessage(fixtures::sessionEndsMessage());

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault(), 100);
    orch.stopSession(id, fixtures::silence(2500));

    EXPECT_EQ(connector.script->bytesSent, 2500u);
    EXPECT_EQ(connector.script->binaryFrames, 3u);
}

TEST_F(SessionOrchestratorTest, ScoringFailureDoesNotAffectSession) {
    connector.script->pushMessage(fixtures::transcriptMessage("u1", "hello investors", 0.0, 1.0));
    connector.script->pushMessage(fixtures::sessionEndsMessage());
    EXPECT_CALL(*scoring, handoff(_, _, _))
        .WillOnce(Throw(utils::ScoringException("scoring service down")));

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());
    auto outcome = orch.stopSession(id);
    orch.shutdown();

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(orch.getSessionState(id).status, SessionStatus::STOPPED);
}

TEST_F(SessionOrchestratorTest, BindFailureIsRetriedAtStop) {
    EXPECT_CALL(provider, createLiveSession(_))
        .WillOnce(Throw(utils::ConnectionException("provider unreachable")))
        .WillOnce(Return(stt::LiveSessionInfo{"live-2", "wss://provider/live-2"}));
    connector.script->pushMessage(fixtures::transcriptMessage("u1", "made it", 0.0, 1.0));
    connector.script->pushMessage(fixtures::sessionEndsMessage());

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());
    EXPECT_EQ(orch.getSessionState(id).status, SessionStatus::RECORDING);
    EXPECT_FALSE(orch.getSessionState(id).binding.has_value());

    auto outcome = orch.stopSession(id);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(connector.lastUrl, "wss://provider/live-2");
}

TEST_F(SessionOrchestratorTest, RepeatedBindFailureEndsInError) {
    EXPECT_CALL(provider, createLiveSession(_))
        .Times(2)
        .WillRepeatedly(Throw(utils::TimeoutException("bind timed out")));

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());
    auto outcome = orch.stopSession(id);

    EXPECT_EQ(outcome.snapshot.status, SessionStatus::ERROR);
    EXPECT_EQ(connector.connectCount, 0u);
}

TEST_F(SessionOrchestratorTest, CancelBeforeStop) {
    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());

    EXPECT_TRUE(orch.cancelSession(id));
    EXPECT_FALSE(orch.cancelSession(id));

    auto state = orch.getSessionState(id);
    EXPECT_EQ(state.status, SessionStatus::ERROR);
    EXPECT_EQ(state.errorMessage, std::string("Session cancelled"));
    EXPECT_THROW(orch.feedAudio(id, fixtures::silence(10)), utils::InactiveSessionException);
    EXPECT_THROW(orch.stopSession(id), utils::TransitionException);
    EXPECT_EQ(orch.activeSessionCount(), 0u);
}

TEST_F(SessionOrchestratorTest, CancelDuringStop) {
    config.streaming().maxConsecutiveTimeouts = 100000;
    EXPECT_CALL(provider, uploadAudio(_, _)).Times(0);

    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createPitchAnalysis());

    auto pending = std::async(std::launch::async, [&orch, &id] { return orch.stopSession(id); });
    for (int i = 0; i < 500; ++i) {
        {
            std::lock_guard<std::mutex> lock(connector.script->mutex);
            if (connector.script->receiveCalls > 0) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_THROW(orch.feedAudio(id, fixtures::silence(10)), utils::InactiveSessionException);
    EXPECT_TRUE(orch.cancelSession(id));

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    auto outcome = pending.get();
    EXPECT_EQ(outcome.snapshot.status, SessionStatus::ERROR);
    EXPECT_EQ(outcome.streamingStopReason, stt::StreamStopReason::CANCELLED);
    EXPECT_EQ(outcome.snapshot.errorMessage, std::string("Session cancelled"));
}

TEST_F(SessionOrchestratorTest, AudioAcceptedDuringStopIsNeverLost) {
    auto& orch = build();

    for (int round = 0; round < 20; ++round) {
        connector.script->pushMessage(fixtures::sessionEndsMessage());
        size_t sentBefore;
        {
            std::lock_guard<std::mutex> lock(connector.script->mutex);
            sentBefore = connector.script->bytesSent;
        }

        auto id = orch.createSession(audio::AudioConfiguration::createDefault());
        std::atomic<size_t> accepted{0};
        std::thread feeder([&orch, &id, &accepted] {
            while (true) {
                try {
                    orch.feedAudio(id, fixtures::silence(100));
                    accepted += 100;
                } catch (const utils::InactiveSessionException&) {
                    return;
                }
            }
        });
        while (accepted.load() < 500) {
            std::this_thread::yield();
        }

        auto outcome = orch.stopSession(id);
        feeder.join();

        EXPECT_TRUE(outcome.succeeded());
        std::lock_guard<std::mutex> lock(connector.script->mutex);
        EXPECT_EQ(connector.script->bytesSent - sentBefore, accepted.load()) << "round " << round;
    }
}

TEST_F(SessionOrchestratorTest, CancelRacingStopEndsCleanly) {
    config.streaming().maxConsecutiveTimeouts = 3;
    auto& orch = build();

    for (int round = 0; round < 20; ++round) {
        auto id = startWithAudio(audio::AudioConfiguration::createDefault(), 512);

        std::promise<void> go;
        std::shared_future<void> ready = go.get_future().share();
        auto stopping = std::async(std::launch::async, [&orch, &id, ready]() -> std::optional<SessionOutcome> {
            ready.wait();
            try {
                return orch.stopSession(id);
            } catch (const utils::TransitionException& e) {
                // only the up-front check may reject the stop
                EXPECT_NE(std::string(e.what()).find("Cannot stop"), std::string::npos) << e.what();
                return std::nullopt;
            }
        });
        auto cancelling = std::async(std::launch::async, [&orch, &id, ready] {
            ready.wait();
            return orch.cancelSession(id);
        });
        go.set_value();

        auto outcome = stopping.get();
        bool cancelled = cancelling.get();
        auto state = orch.getSessionState(id);

        EXPECT_TRUE(isTerminalStatus(state.status)) << "round " << round;
        if (outcome) {
            EXPECT_EQ(outcome->snapshot.status, state.status);
        } else {
            EXPECT_TRUE(cancelled);
            EXPECT_EQ(state.status, SessionStatus::ERROR);
            EXPECT_EQ(state.errorMessage, std::string("Session cancelled"));
        }
        if (!cancelled) {
            EXPECT_EQ(state.status, SessionStatus::STOPPED);
        }
    }
}

TEST_F(SessionOrchestratorTest, StopTwiceIsRejected) {
    auto& orch = build();
    auto id = startWithAudio(audio::AudioConfiguration::createDefault());
    orch.stopSession(id);
    EXPECT_THROW(orch.stopSession(id), utils::TransitionException);
}

TEST_F(SessionOrchestratorTest, UnknownSession) {
    auto& orch = build();
    EXPECT_THROW(orch.getSessionState("sess_missing"), utils::SessionNotFoundException);
    EXPECT_THROW(orch.feedAudio("sess_missing", fixtures::silence(1)), utils::SessionNotFoundException);
    EXPECT_THROW(orch.stopSession("sess_missing"), utils::SessionNotFoundException);
    EXPECT_THROW(orch.cancelSession("sess_missing"), utils::SessionNotFoundException);
    EXPECT_FALSE(orch.releaseSession("sess_missing"));
}

TEST_F(SessionOrchestratorTest, ReleaseAndPurge) {
    auto& orch = build();
    auto live = orch.createSession(audio::AudioConfiguration::createDefault());
    auto finished = orch.createSession(audio::AudioConfiguration::createDefault());
    orch.stopSession(finished);
    EXPECT_EQ(orch.sessionCount(), 2u);

    EXPECT_EQ(orch.purgeTerminalSessions(std::chrono::hours(1)), 0u);
    EXPECT_EQ(orch.purgeTerminalSessions(std::chrono::milliseconds(0)), 1u);

    EXPECT_TRUE(orch.releaseSession(live));
    EXPECT_EQ(orch.sessionCount(), 0u);
}

TEST_F(SessionOrchestratorTest, ShutdownIsIdempotent) {
    auto& orch = build();
    auto id = orch.createSession(audio::AudioConfiguration::createDefault());
    orch.shutdown();
    orch.shutdown();
    EXPECT_EQ(orch.getSessionState(id).status, SessionStatus::CONNECTED);
}
