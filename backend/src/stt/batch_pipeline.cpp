#include "stt/batch_pipeline.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace pitchscribe {
namespace stt {

namespace {

/**
 * Deletes the provider job on every exit path once it has been submitted.
 */
class JobCleanup {
public:
    JobCleanup(ProviderClient& client, std::string jobId, bool enabled)
        : client_(client), jobId_(std::move(jobId)), enabled_(enabled) {}

    ~JobCleanup() {
        if (!enabled_ || jobId_.empty()) {
            return;
        }
        try {
            client_.deleteJob(jobId_);
        } catch (const std::exception& e) {
            utils::Logger::warn("Failed to delete batch job " + jobId_ + ": " + e.what());
        }
    }

    JobCleanup(const JobCleanup&) = delete;
    JobCleanup& operator=(const JobCleanup&) = delete;

private:
    ProviderClient& client_;
    std::string jobId_;
    bool enabled_;
};

const nlohmann::json* findUtterances(const nlohmann::json& job) {
    if (job.contains("result") && job.at("result").is_object()) {
        const auto& result = job.at("result");
        if (result.contains("transcription") && result.at("transcription").is_object() &&
            result.at("transcription").contains("utterances")) {
            return &result.at("transcription").at("utterances");
        }
        if (result.contains("utterances")) {
            return &result.at("utterances");
        }
    }
    if (job.contains("prediction") && job.at("prediction").is_object() &&
        job.at("prediction").contains("utterances")) {
        return &job.at("prediction").at("utterances");
    }
    return nullptr;
}

std::string detectedLanguage(const nlohmann::json& job) {
    const auto pointer = nlohmann::json::json_pointer("/result/transcription/languages");
    if (job.contains(pointer) && job.at(pointer).is_array() && !job.at(pointer).empty() &&
        job.at(pointer).at(0).is_string()) {
        return job.at(pointer).at(0).get<std::string>();
    }
    return "en";
}

} // namespace

BatchTranscriptionPipeline::BatchTranscriptionPipeline(ProviderClient& client,
                                                       utils::BatchSettings settings)
    : client_(client), settings_(settings) {
}

BatchResult BatchTranscriptionPipeline::run(const std::vector<uint8_t>& audio,
                                            const audio::AudioConfiguration& config,
                                            utils::CancellationToken& token,
                                            const std::string& sessionId) {
    utils::ErrorContext context("BatchTranscription", sessionId);

    if (audio.size() > settings_.maxUploadBytes) {
        throw utils::SizeLimitExceededException(audio.size(), settings_.maxUploadBytes);
    }

    BatchResult result;
    if (token.isCancelled()) {
        result.cancelled = true;
        return result;
    }

    std::string audioUrl = client_.uploadAudio(audio, "session_" + sessionId + ".wav");
    if (token.isCancelled()) {
        result.cancelled = true;
        return result;
    }

    SubmittedJob job = client_.submitTranscription(audioUrl, config);
    JobCleanup cleanup(client_, job.id, settings_.deleteJobAfterCompletion);

    return poll(job, token, sessionId);
}

BatchResult BatchTranscriptionPipeline::poll(const SubmittedJob& job, utils::CancellationToken& token,
                                             const std::string& sessionId) {
    BatchResult result;
    result.jobId = job.id;

    for (size_t attempt = 1; attempt <= settings_.maxPollAttempts; ++attempt) {
        if (token.isCancelled()) {
            result.cancelled = true;
            return result;
        }

        result.pollAttempts = attempt;
        try {
            JobStatus status = client_.fetchJob(job.resultUrl);
            utils::Logger::debug("Batch job " + job.id + " attempt " + std::to_string(attempt) +
                                 ": " + status.rawStatus);

            if (status.state == JobStatus::State::DONE) {
                result.segments = extractSegments(status.payload);
                if (status.payload.contains("result")) {
                    result.annotations = IntelligenceAnnotations::fromProviderResult(
                        status.payload.at("result"));
                }
                utils::Logger::info("Batch job " + job.id + " for session " + sessionId +
                                    " produced " + std::to_string(result.segments.size()) +
                                    " segments after " + std::to_string(attempt) + " polls");
                return result;
            }
            if (status.state == JobStatus::State::ERROR) {
                throw utils::UpstreamJobException("Batch transcription failed: " + status.errorMessage,
                                                  job.id);
            }
        } catch (const utils::ConnectionException& e) {
            utils::Logger::warn("Poll attempt " + std::to_string(attempt) + " for job " + job.id +
                                " failed: " + e.what());
        } catch (const utils::TimeoutException& e) {
            utils::Logger::warn("Poll attempt " + std::to_string(attempt) + " for job " + job.id +
                                " timed out: " + e.what());
        }

        if (attempt < settings_.maxPollAttempts && !token.sleepFor(settings_.pollInterval)) {
            result.cancelled = true;
            return result;
        }
    }

    throw utils::TimeoutException("Batch job " + job.id + " not done after " +
                                  std::to_string(settings_.maxPollAttempts) + " polls",
                                  "BatchPolling");
}

std::vector<TranscriptSegment> BatchTranscriptionPipeline::extractSegments(const nlohmann::json& job) {
    std::vector<TranscriptSegment> segments;
    const nlohmann::json* utterances = findUtterances(job);
    if (!utterances || !utterances->is_array()) {
        return segments;
    }

    const std::string language = detectedLanguage(job);
    for (const auto& utterance : *utterances) {
        if (!utterance.is_object()) {
            continue;
        }
        try {
            std::string text = utterance.value("text", std::string());
            std::optional<int> channel;
            std::optional<double> confidence;
            if (utterance.contains("channel") && utterance.at("channel").is_number_integer()) {
                channel = utterance.at("channel").get<int>();
            }
            if (utterance.contains("confidence") && utterance.at("confidence").is_number()) {
                confidence = utterance.at("confidence").get<double>();
            }
            segments.emplace_back("batch_" + std::to_string(segments.size()),
                                  text,
                                  utterance.value("start", 0.0),
                                  utterance.value("end", 0.0),
                                  utterance.value("language", language),
                                  channel, confidence, true);
        } catch (const utils::ProtocolException& e) {
            utils::Logger::debug(std::string("Skipping batch utterance: ") + e.what());
        } catch (const nlohmann::json::exception& e) {
            utils::Logger::debug(std::string("Skipping malformed batch utterance: ") + e.what());
        }
    }
    return segments;
}

} // namespace stt
} // namespace pitchscribe
