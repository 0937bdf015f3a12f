#include <gtest/gtest.h>
#include <future>
#include "core/session_events.hpp"
#include "../fixtures/mock_provider.hpp"
#include "../fixtures/test_data_generator.hpp"

using namespace pitchscribe::core;

namespace {

SessionEvent statusEvent(const std::string& sessionId, SessionStatus status) {
    SessionEvent event;
    event.type = SessionEvent::Type::STATUS_CHANGED;
    event.sessionId = sessionId;
    event.status = status;
    return event;
}

class ThrowingObserver : public SessionObserver {
public:
    void onStatusChanged(const std::string&, SessionStatus, SessionStatus) override {
        throw std::runtime_error("observer broke");
    }
    void onSegmentAdded(const std::string&, const pitchscribe::stt::TranscriptSegment&) override {}
    void onSessionError(const std::string&, const std::string&) override {}
};

// Parks the dispatcher inside the first delivery until released
class BlockingObserver : public SessionObserver {
public:
    void onStatusChanged(const std::string&, SessionStatus, SessionStatus) override {
        if (!blocked_) {
            blocked_ = true;
            entered.set_value();
            release.get_future().wait();
        }
    }
    void onSegmentAdded(const std::string&, const pitchscribe::stt::TranscriptSegment&) override {}
    void onSessionError(const std::string&, const std::string&) override {}

    std::promise<void> entered;
    std::promise<void> release;

private:
    bool blocked_ = false;
};

} // namespace

class NotificationChannelTest : public ::testing::Test {
protected:
    std::chrono::milliseconds timeout{2000};
};

TEST_F(NotificationChannelTest, DeliversInOrder) {
    NotificationChannel channel(16);
    auto observer = std::make_shared<fixtures::RecordingObserver>();
    channel.subscribe(observer);

    channel.publish(statusEvent("sess_1", SessionStatus::CONNECTED));
    SessionEvent segment;
    segment.type = SessionEvent::Type::SEGMENT_ADDED;
    segment.sessionId = "sess_1";
    segment.segment = fixtures::makeSegment("u1", "hello", 0.0, 1.0);
    channel.publish(segment);
    SessionEvent error;
    error.type = SessionEvent::Type::SESSION_ERROR;
    error.sessionId = "sess_1";
    error.errorMessage = "provider unreachable";
    channel.publish(error);

    ASSERT_TRUE(channel.flush(timeout));
    EXPECT_EQ(channel.deliveredCount(), 3u);
    ASSERT_EQ(observer->statuses.size(), 1u);
    EXPECT_EQ(observer->statuses[0].second, SessionStatus::CONNECTED);
    EXPECT_EQ(observer->segmentIds, std::vector<std::string>{"u1"});
    EXPECT_EQ(observer->errors, std::vector<std::string>{"provider unreachable"});
}

TEST_F(NotificationChannelTest, FailingObserverDoesNotBlockOthers) {
    NotificationChannel channel;
    auto broken = std::make_shared<ThrowingObserver>();
    auto healthy = std::make_shared<fixtures::RecordingObserver>();
    channel.subscribe(broken);
    channel.subscribe(healthy);

    channel.publish(statusEvent("sess_1", SessionStatus::RECORDING));
    channel.publish(statusEvent("sess_1", SessionStatus::STOPPING));

    ASSERT_TRUE(channel.flush(timeout));
    EXPECT_EQ(channel.observerFailureCount(), 2u);
    EXPECT_EQ(healthy->statuses.size(), 2u);
}

TEST_F(NotificationChannelTest, DropsOldestWhenFull) {
    NotificationChannel channel(2);
    auto blocker = std::make_shared<BlockingObserver>();
    auto recorder = std::make_shared<fixtures::RecordingObserver>();
    channel.subscribe(blocker);
    channel.subscribe(recorder);

    channel.publish(statusEvent("first", SessionStatus::CONNECTED));
    blocker->entered.get_future().wait();

    channel.publish(statusEvent("a", SessionStatus::RECORDING));
    channel.publish(statusEvent("b", SessionStatus::STOPPING));
    channel.publish(statusEvent("c", SessionStatus::STOPPED));
    EXPECT_EQ(channel.droppedCount(), 1u);
    EXPECT_EQ(channel.pendingCount(), 2u);

    blocker->release.set_value();
    ASSERT_TRUE(channel.flush(timeout));

    ASSERT_EQ(recorder->statuses.size(), 3u);
    EXPECT_EQ(recorder->statuses[0].first, "first");
    EXPECT_EQ(recorder->statuses[1].first, "b");
    EXPECT_EQ(recorder->statuses[2].first, "c");
}

TEST_F(NotificationChannelTest, UnsubscribeStopsDelivery) {
    NotificationChannel channel;
    auto observer = std::make_shared<fixtures::RecordingObserver>();
    channel.subscribe(observer);
    channel.unsubscribe(observer);

    channel.publish(statusEvent("sess_1", SessionStatus::CONNECTED));
    ASSERT_TRUE(channel.flush(timeout));
    EXPECT_TRUE(observer->statuses.empty());
    EXPECT_EQ(channel.deliveredCount(), 1u);
}

TEST_F(NotificationChannelTest, ShutdownIsIdempotentAndRejectsEvents) {
    NotificationChannel channel;
    channel.shutdown();
    channel.shutdown();

    channel.publish(statusEvent("sess_1", SessionStatus::CONNECTED));
    EXPECT_EQ(channel.pendingCount(), 0u);
    EXPECT_EQ(channel.deliveredCount(), 0u);
}
