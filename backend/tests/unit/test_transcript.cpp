#include <gtest/gtest.h>
#include "stt/transcript.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"

using namespace pitchscribe::stt;
using pitchscribe::utils::ProtocolException;
using fixtures::makeSegment;

class TranscriptSegmentTest : public ::testing::Test {};

TEST_F(TranscriptSegmentTest, ValidatesFields) {
    EXPECT_THROW(makeSegment("s", "   ", 0.0, 1.0), ProtocolException);
    EXPECT_THROW(makeSegment("s", "hi", -0.5, 1.0), ProtocolException);
    EXPECT_THROW(makeSegment("s", "hi", 2.0, 1.0), ProtocolException);
    EXPECT_THROW(makeSegment("s", "hi", 0.0, 1.0, true, 1.2), ProtocolException);
    EXPECT_THROW(makeSegment("s", "hi", 0.0, 1.0, true, std::nullopt, -1), ProtocolException);

    // zero-length segments are allowed
    EXPECT_NO_THROW(makeSegment("s", "hi", 1.0, 1.0));
}

TEST_F(TranscriptSegmentTest, DerivedValues) {
    auto segment = makeSegment("s1", "  we build  tools ", 1.5, 4.0, true, 0.75);

    EXPECT_DOUBLE_EQ(segment.duration(), 2.5);
    EXPECT_EQ(segment.wordCount(), 3u);
    EXPECT_FALSE(segment.hasHighConfidence());
    EXPECT_TRUE(segment.hasHighConfidence(0.7));

    auto noConfidence = makeSegment("s2", "hello", 0.0, 1.0);
    EXPECT_TRUE(noConfidence.hasHighConfidence(0.99));
}

TEST_F(TranscriptSegmentTest, JsonIncludesDerivedFields) {
    auto segment = makeSegment("s1", "hello there", 0.0, 2.0, false, 0.9, 1);
    auto j = segment.toJson();

    EXPECT_EQ(j.at("word_count"), 2);
    EXPECT_DOUBLE_EQ(j.at("duration").get<double>(), 2.0);
    EXPECT_EQ(j.at("channel"), 1);
    EXPECT_FALSE(j.at("is_final").get<bool>());

    EXPECT_EQ(TranscriptSegment::fromJson(j), segment);
}

TEST_F(TranscriptSegmentTest, FromJsonRejectsMalformed) {
    EXPECT_THROW(TranscriptSegment::fromJson({{"text", "hi"}}), ProtocolException);
    EXPECT_THROW(TranscriptSegment::fromJson({{"text", ""}, {"start_time", 0.0}, {"end_time", 1.0}}),
                 ProtocolException);
}

class TranscriptCollectionTest : public ::testing::Test {
protected:
    TranscriptCollection sample() const {
        return TranscriptCollection({
            makeSegment("b", "second part", 3.0, 5.0, true, 0.9, 1),
            makeSegment("a", "first words here", 1.0, 3.0, true, 0.95, 0),
            makeSegment("c", "interim", 5.0, 6.5, false, 0.6, 0)
        });
    }
};

TEST_F(TranscriptCollectionTest, OrderedByStartTime) {
    auto transcript = sample();

    ASSERT_EQ(transcript.segmentCount(), 3u);
    EXPECT_EQ(transcript.getSegments()[0].getId(), "a");
    EXPECT_EQ(transcript.getSegments()[1].getId(), "b");
    EXPECT_EQ(transcript.fullText(), "first words here second part interim");
}

TEST_F(TranscriptCollectionTest, Aggregates) {
    auto transcript = sample();

    EXPECT_EQ(transcript.wordCount(), 6u);
    EXPECT_DOUBLE_EQ(transcript.totalDuration(), 5.5);

    auto empty = TranscriptCollection::empty();
    EXPECT_TRUE(empty.isEmpty());
    EXPECT_DOUBLE_EQ(empty.totalDuration(), 0.0);
    EXPECT_EQ(empty.fullText(), "");
}

TEST_F(TranscriptCollectionTest, AddSegmentReturnsNewCollection) {
    auto original = sample();
    auto extended = original.addSegment(makeSegment("z", "opening", 0.0, 0.8));

    EXPECT_EQ(original.segmentCount(), 3u);
    ASSERT_EQ(extended.segmentCount(), 4u);
    EXPECT_EQ(extended.getSegments().front().getId(), "z");
    EXPECT_EQ(extended.getCreatedAt(), original.getCreatedAt());
}

TEST_F(TranscriptCollectionTest, Filters) {
    auto transcript = sample();

    auto finals = transcript.finalSegmentsOnly();
    EXPECT_EQ(finals.segmentCount(), 2u);

    auto channelZero = transcript.segmentsByChannel(0);
    ASSERT_EQ(channelZero.segmentCount(), 2u);
    EXPECT_EQ(channelZero.getSegments()[1].getId(), "c");

    EXPECT_TRUE(transcript.segmentsByChannel(4).isEmpty());
}

TEST_F(TranscriptCollectionTest, JsonRoundTrip) {
    auto transcript = sample();
    auto restored = TranscriptCollection::fromJson(transcript.toJson());

    EXPECT_EQ(restored.getSegments(), transcript.getSegments());
    EXPECT_EQ(restored.wordCount(), transcript.wordCount());
    EXPECT_DOUBLE_EQ(restored.totalDuration(), transcript.totalDuration());
    EXPECT_EQ(restored.fullText(), transcript.fullText());
}

TEST_F(TranscriptCollectionTest, FromJsonRequiresSegments) {
    EXPECT_THROW(TranscriptCollection::fromJson(nlohmann::json::object()), ProtocolException);
}
