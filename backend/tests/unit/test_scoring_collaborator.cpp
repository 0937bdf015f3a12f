#include <gtest/gtest.h>
#include "core/scoring_collaborator.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"

using namespace pitchscribe::core;
using namespace pitchscribe::stt;

class ScoringCollaboratorTest : public ::testing::Test {
protected:
    TranscriptCollection transcript{std::vector<TranscriptSegment>{
        fixtures::makeSegment("s1", "we sell calm", 0.0, 2.0),
        fixtures::makeSegment("s2", "to busy teams", 2.5, 4.0)
    }};
    AudioIntelligenceReport report = AudioIntelligenceExtractor().analyze(transcript);
};

TEST_F(ScoringCollaboratorTest, PayloadCarriesTranscriptAndReport) {
    auto payload = ScoringCollaborator::buildPayload("sess_42", transcript, report);

    EXPECT_EQ(payload.at("session_id"), "sess_42");
    EXPECT_EQ(payload.at("full_text"), "we sell calm to busy teams");
    EXPECT_EQ(payload.at("transcript").at("segments").size(), 2u);
    EXPECT_EQ(payload.at("intelligence").at("delivery_score"), report.deliveryScore);
    EXPECT_TRUE(payload.at("intelligence").contains("speech_metrics"));
}

TEST_F(ScoringCollaboratorTest, LoggingCollaboratorAcceptsAnything) {
    LoggingScoringCollaborator collaborator;
    EXPECT_NO_THROW(collaborator.handoff("sess_42", transcript, report));
    EXPECT_NO_THROW(collaborator.handoff("sess_43", TranscriptCollection::empty(),
                                         AudioIntelligenceExtractor().analyze(TranscriptCollection::empty())));
}

TEST_F(ScoringCollaboratorTest, UnreachableEndpointRaisesScoringError) {
    // nothing listens on port 1
    HttpScoringCollaborator collaborator("http://127.0.0.1:1/score", std::chrono::milliseconds(500));
    EXPECT_EQ(collaborator.endpoint(), "http://127.0.0.1:1/score");
    EXPECT_THROW(collaborator.handoff("sess_42", transcript, report), pitchscribe::utils::ScoringException);
}
