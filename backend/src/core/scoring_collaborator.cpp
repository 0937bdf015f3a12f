#include "core/scoring_collaborator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cpr/cpr.h>
#include <sstream>
#include <iomanip>

namespace pitchscribe {
namespace core {

nlohmann::json ScoringCollaborator::buildPayload(const std::string& sessionId,
                                                 const stt::TranscriptCollection& transcript,
                                                 const stt::AudioIntelligenceReport& report) {
    return {
        {"session_id", sessionId},
        {"transcript", transcript.toJson()},
        {"full_text", transcript.fullText()},
        {"intelligence", report.toJson()}
    };
}

HttpScoringCollaborator::HttpScoringCollaborator(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
}

void HttpScoringCollaborator::handoff(const std::string& sessionId,
                                      const stt::TranscriptCollection& transcript,
                                      const stt::AudioIntelligenceReport& report) {
    auto body = buildPayload(sessionId, transcript, report);
    auto r = cpr::Post(cpr::Url{endpoint_},
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Body{body.dump()},
                       cpr::Timeout{timeout_});

    if (r.error.code != cpr::ErrorCode::OK) {
        throw utils::ScoringException("Scoring handoff failed: " + r.error.message, sessionId);
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        throw utils::ScoringException("Scoring endpoint returned HTTP " +
                                      std::to_string(r.status_code), sessionId);
    }
    utils::Logger::info("Session " + sessionId + " handed off to scoring");
}

void LoggingScoringCollaborator::handoff(const std::string& sessionId,
                                         const stt::TranscriptCollection& transcript,
                                         const stt::AudioIntelligenceReport& report) {
    std::ostringstream oss;
    oss << "Session " << sessionId << " finished: " << transcript.segmentCount()
        << " segments, " << transcript.wordCount() << " words, delivery score "
        << std::fixed << std::setprecision(1) << report.deliveryScore << "/25";
    utils::Logger::info(oss.str());
}

} // namespace core
} // namespace pitchscribe
